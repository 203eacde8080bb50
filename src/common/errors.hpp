#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace noura {

class NouraError : public std::runtime_error {
public:
    explicit NouraError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Rejected input. The persisted state is untouched.
class ValidationError : public NouraError {
public:
    explicit ValidationError(const std::string &message)
        : NouraError(message)
    {
    }
};

class StockInsufficientError : public ValidationError {
public:
    StockInsufficientError(int64_t productId,
                           const std::string &productName,
                           double available,
                           double requested)
        : ValidationError(formatMessage(productName, available, requested))
        , m_productId(productId)
        , m_productName(productName)
        , m_available(available)
        , m_requested(requested)
    {
    }

    int64_t productId() const { return m_productId; }
    const std::string &productName() const { return m_productName; }
    double available() const { return m_available; }
    double requested() const { return m_requested; }

private:
    static std::string formatNumber(double value)
    {
        std::string text = std::to_string(value);
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
        return text;
    }

    static std::string formatMessage(const std::string &productName,
                                     double available,
                                     double requested)
    {
        return "insufficient stock for '" + productName + "': available "
            + formatNumber(available) + ", requested " + formatNumber(requested);
    }

    int64_t m_productId;
    std::string m_productName;
    double m_available;
    double m_requested;
};

class NotFoundError : public NouraError {
public:
    explicit NotFoundError(const std::string &message)
        : NouraError(message)
    {
    }
};

class ProductNotFoundError : public NotFoundError {
public:
    explicit ProductNotFoundError(int64_t productId)
        : NotFoundError("product " + std::to_string(productId) + " not found")
        , m_productId(productId)
    {
    }

    int64_t productId() const { return m_productId; }

private:
    int64_t m_productId;
};

// I/O, constraint and migration failures reported by SQLite.
class StorageError : public NouraError {
public:
    explicit StorageError(const std::string &message)
        : NouraError(message)
    {
    }
};

} // namespace noura
