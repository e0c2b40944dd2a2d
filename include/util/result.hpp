#ifndef RESULT_HPP
#define RESULT_HPP

#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind : std::uint8_t {
    InvalidInput,
    InvalidHandInput,
    IllegalAction,
    PotAccountingViolation
};

struct EngineError {
    ErrorKind kind;
    std::string message;

    bool operator==(const EngineError&) const = default;
};

std::string getErrorKindName(ErrorKind kind);

template <typename T>
class Result {
public:
    Result(const T& value) : m_data{ value } {}
    Result(T&& value) : m_data{ std::move(value) } {}
    Result(const EngineError& error) : m_data{ error } {}
    Result(EngineError&& error) : m_data{ std::move(error) } {}

    // Plain messages are input errors, which is what the parsers report
    Result(const std::string& error) : m_data{ EngineError{ ErrorKind::InvalidInput, error } } {}
    Result(std::string&& error) : m_data{ EngineError{ ErrorKind::InvalidInput, std::move(error) } } {}
    Result(const char* error) : m_data{ EngineError{ ErrorKind::InvalidInput, std::string{error} } } {}

    bool isValue() const {
        return std::holds_alternative<T>(m_data);
    }

    bool isError() const {
        return std::holds_alternative<EngineError>(m_data);
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<T>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<T>(m_data);
    }

    const EngineError& getEngineError() const {
        assert(isError());
        return std::get<EngineError>(m_data);
    }

    const std::string& getError() const {
        return getEngineError().message;
    }

    ErrorKind getErrorKind() const {
        return getEngineError().kind;
    }

private:
    std::variant<T, EngineError> m_data;
};

#endif // RESULT_HPP
