#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {
constexpr const char* Whitespace = " \t\n\r\f\v";
} // namespace

std::string trim(const std::string& input) {
    std::size_t start = input.find_first_not_of(Whitespace);
    if (start == std::string::npos) {
        return "";
    }
    std::size_t end = input.find_last_not_of(Whitespace);
    return input.substr(start, end - start + 1);
}

std::string toLower(const std::string& input) {
    std::string output = input;
    for (char& c : output) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return output;
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::vector<std::string> parseTokens(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream stream(input);
    std::string token;
    while (std::getline(stream, token, delimiter)) {
        std::string trimmed = trim(token);
        if (!trimmed.empty()) {
            tokens.push_back(trimmed);
        }
    }
    return tokens;
}

std::optional<int> parseInt(const std::string& input) {
    // std::stoi accepts trailing garbage ("12abc"), so check that everything was consumed
    try {
        std::size_t charactersRead = 0;
        int value = std::stoi(input, &charactersRead);
        if (charactersRead != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatFixedPoint(double num, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << num;
    return ss.str();
}
