#pragma once

namespace noura {

enum class ReportPeriod {
    Daily,
    Monthly,
    Yearly
};

enum class OutputFormat {
    Text,
    Json
};

} // namespace noura
