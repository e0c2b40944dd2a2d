#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = std::nullopt, .handler = handler });
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = argument, .handler = handler });
}

bool CliDispatcher::addCommand(const std::string& name, Command command) {
    bool isPrintable = std::all_of(name.begin(), name.end(), [](char c) {
        return std::isgraph(static_cast<unsigned char>(c));
    });
    if (name.empty() || !isPrintable || m_commands.count(name) > 0) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commands.emplace(name, std::move(command));
    return true;
}

bool CliDispatcher::execute(const std::string& commandLine) {
    std::string line = trim(commandLine);
    if (line.empty()) {
        return false;
    }

    std::size_t nameEnd = line.find(' ');
    std::string name = line.substr(0, nameEnd);
    std::string argument = (nameEnd == std::string::npos) ? "" : trim(line.substr(nameEnd + 1));

    auto it = m_commands.find(name);
    if (it == m_commands.end()) {
        std::cerr << "Error: Unknown command: " << name << "\n";
        return false;
    }

    const Command& command = it->second;
    if (!command.argument) {
        if (!argument.empty()) {
            std::cerr << "Error: " << name << " does not take an argument.\n";
            return false;
        }
        return std::get<HandlerWithoutArgument>(command.handler)();
    }

    if (argument.empty()) {
        std::cerr << "Error: " << name << " expects an argument <" << *command.argument << ">.\n";
        return false;
    }
    return std::get<HandlerWithArgument>(command.handler)(argument);
}

void CliDispatcher::run(std::istream& input) {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";

    std::string line;
    while (m_isRunning) {
        std::cout << "> " << std::flush;
        if (!std::getline(input, line)) {
            std::cout << "\n";
            break;
        }

        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        execute(trimmed);
    }

    m_isRunning = false;
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " commands:\n";
    for (const std::string& name : m_commandOrder) {
        const Command& command = m_commands.at(name);
        std::cout << "    " << name;
        if (command.argument) {
            std::cout << " <" << *command.argument << ">";
        }
        std::cout << ": " << command.description << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
