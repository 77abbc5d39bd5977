/**
 * @file console.hpp
 * @brief interactive console driving a List
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <iostream>
#include <map>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

#include "anylist/console/config.hpp"
#include "anylist/console/logger.hpp"
#include "anylist/list.hpp"
#include "anylist/printvalue.hpp"
#include "anylist/stringprocess.hpp"

namespace anylist::console {

struct ConsoleApp {
    struct Command {
        std::size_t args;
        std::function<std::expected<void, std::string>(ConsoleApp &, const std::vector<std::string_view> &)> callback;
    };
    static std::map<std::string, Command, std::less<>> commandCallbacks;
    static constexpr std::size_t kMaxScriptDepth = 8;

    explicit ConsoleApp(std::ostream &out = std::cout) : out(out) {}

    /**
     * @brief register config listeners, then load and write back cfgFile
     *
     */
    void initCfg(const std::string &cfgFile = "anylist.ini");

    std::expected<void, std::string> setConfig(const std::string &key, const std::string &value);

    /**
     * @brief run commands of a yaml script, stop at the first failed one
     *
     * @param scriptFile yaml file with optional "config" map and "commands" sequence
     */
    std::expected<void, std::string> loadScript(const std::string &scriptFile);

    std::expected<void, std::string> processCommand(std::string_view command) {
        auto line = mystr::split(mystr::removeSpaceView(command), ' ');
        if (line.empty()) {
            return {};
        }
        auto it = commandCallbacks.find(line[0]);
        if (it == commandCallbacks.end()) {
            return std::unexpected("unknown command, all commands: " +
                                   mystr::join(commandCallbacks | std::views::keys, ", "));
        }
        if (it->second.args != line.size() - 1) {
            return std::unexpected("argument count mismatch");
        }
        logger.writeLog("Console", command, kDebug);
        auto ans = it->second.callback(*this, line);
        if (!ans) {
            logger.writeLog("Console", "\"" + std::string(command) + "\" failed: " + ans.error(), kError);
        }
        return ans;
    }

    void replMode(std::istream &in) {
        std::string command;
        while (true) {
            out << ">>> " << std::flush;
            if (!std::getline(in, command)) {
                break;
            }
            if (auto ans = processCommand(command); !ans) {
                out << ans.error() << std::endl;
            }
        }
    }

    std::ostream &out;
    Config cfg;
    Logger logger;
    List list;
    const Formation *format = &DefaultFormat;
    std::size_t scriptDepth = 0;
};

} // namespace anylist::console
