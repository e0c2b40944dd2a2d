#ifndef CLI_DISPATCHER_HPP
#define CLI_DISPATCHER_HPP

#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

using HandlerWithoutArgument = std::function<bool()>;
using HandlerWithArgument = std::function<bool(const std::string&)>;

struct Version {
    int major;
    int minor;
    int patch;
};

// Line based command shell. Every command takes either no argument or a single
// argument made of the rest of the line, so "evaluate As Kd 7h 4c 2s" works.
class CliDispatcher {
public:
    CliDispatcher(const std::string& programName, const Version& version);

    bool registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler);
    bool registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler);

    // Returns whether the command succeeded
    bool execute(const std::string& commandLine);

    // Reads commands until "exit" or the end of the input. Lines starting with # are skipped.
    void run(std::istream& input);

private:
    struct Command {
        std::string description;
        std::optional<std::string> argument;
        std::variant<HandlerWithoutArgument, HandlerWithArgument> handler;
    };

    bool addCommand(const std::string& name, Command command);
    bool handleHelp() const;
    bool handleExit();

    std::string m_programName;
    Version m_version;
    bool m_isRunning;
    std::vector<std::string> m_commandOrder;
    std::unordered_map<std::string, Command> m_commands;
};

#endif // CLI_DISPATCHER_HPP
