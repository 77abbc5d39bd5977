#include "anylist/console/console.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#include "yaml-cpp/yaml.h"

#include "anylist/dowithcatch.hpp"
#include "anylist/parsevalue.hpp"

namespace {

using anylist::parseError;
using anylist::console::ConsoleApp;
using Line = std::vector<std::string_view>;

std::string valueError(std::string_view type, std::string_view text, parseError err) {
    return "cannot make " + std::string(type) + " from \"" + std::string(text) + "\": " +
           std::string(anylist::describe(err));
}

std::expected<std::size_t, std::string> parseIndex(std::string_view text) {
    auto index = anylist::parseValue<uint64_t>(text);
    if (!index) {
        return std::unexpected("bad index \"" + std::string(text) + "\"");
    }
    return static_cast<std::size_t>(index.value());
}

// nullopt if the integral sum does not fit in Ty
template <typename Ty>
std::optional<Ty> checkedAdd(Ty lhs, Ty rhs) {
    if constexpr (std::is_integral_v<Ty>) {
        if (rhs > 0 && lhs > std::numeric_limits<Ty>::max() - rhs) {
            return std::nullopt;
        }
        if constexpr (std::is_signed_v<Ty>) {
            if (rhs < 0 && lhs < std::numeric_limits<Ty>::min() - rhs) {
                return std::nullopt;
            }
        }
    }
    return static_cast<Ty>(lhs + rhs);
}

template <bool AtBeginning>
std::expected<void, std::string> insertParsed(ConsoleApp &app, std::string_view type, std::string_view text) {
    auto ans = anylist::visitTypeName(type, [&](auto tag) -> std::expected<void, parseError> {
        using Ty = typename decltype(tag)::type;
        auto value = anylist::parseValue<Ty>(text);
        if (!value) {
            return std::unexpected(value.error());
        }
        if constexpr (AtBeginning) {
            app.list.insertAtBeginning(std::move(value.value()));
        } else {
            app.list.insert(std::move(value.value()));
        }
        return {};
    });
    if (!ans) {
        return std::unexpected(valueError(type, text, ans.error()));
    }
    return {};
}

inline std::expected<void, std::string> push(ConsoleApp &app, const Line &line) {
    return insertParsed<false>(app, line[1], line[2]);
}

inline std::expected<void, std::string> front(ConsoleApp &app, const Line &line) {
    return insertParsed<true>(app, line[1], line[2]);
}

inline std::expected<void, std::string> replace(ConsoleApp &app, const Line &line) {
    auto index = parseIndex(line[1]);
    if (!index) {
        return std::unexpected(index.error());
    }
    std::expected<void, anylist::IndexOutOfRange> replaced;
    auto ans = anylist::visitTypeName(line[2], [&](auto tag) -> std::expected<void, parseError> {
        using Ty = typename decltype(tag)::type;
        auto value = anylist::parseValue<Ty>(line[3]);
        if (!value) {
            return std::unexpected(value.error());
        }
        replaced = app.list.replace(index.value(), std::move(value.value()));
        return {};
    });
    if (!ans) {
        return std::unexpected(valueError(line[2], line[3], ans.error()));
    }
    if (!replaced) {
        return std::unexpected(replaced.error().message());
    }
    return {};
}

inline std::expected<void, std::string> get(ConsoleApp &app, const Line &line) {
    auto index = parseIndex(line[2]);
    if (!index) {
        return std::unexpected(index.error());
    }
    auto ans = anylist::visitTypeName(line[1], [&](auto tag) {
        using Ty = typename decltype(tag)::type;
        if (auto p = app.list.get<Ty>(index.value())) {
            app.out << anylist::printToString(*p, *app.format) << std::endl;
        } else {
            app.out << "[absent]" << std::endl;
        }
    });
    if (!ans) {
        return std::unexpected("unknown type \"" + std::string(line[1]) + "\"");
    }
    return {};
}

inline std::expected<void, std::string> add(ConsoleApp &app, const Line &line) {
    auto index = parseIndex(line[2]);
    if (!index) {
        return std::unexpected(index.error());
    }
    std::string failure;
    auto ans = anylist::visitTypeName(line[1], [&](auto tag) -> std::expected<void, parseError> {
        using Ty = typename decltype(tag)::type;
        if constexpr (!anylist::numerical<Ty>) {
            failure = "add only support numerical types";
            return {};
        } else {
            auto delta = anylist::parseValue<Ty>(line[3]);
            if (!delta) {
                return std::unexpected(delta.error());
            }
            auto p = app.list.getMut<Ty>(index.value());
            if (!p) {
                failure = "no " + std::string(line[1]) + " at index " + std::to_string(index.value());
                return {};
            }
            auto sum = checkedAdd<Ty>(*p, delta.value());
            if (!sum) {
                failure = "overflow when add " + std::string(line[3]) + " to " + std::string(line[1]) +
                          " at index " + std::to_string(index.value());
                return {};
            }
            *p = sum.value();
            app.out << anylist::printToString(*p, *app.format) << std::endl;
            return {};
        }
    });
    if (!ans) {
        return std::unexpected(valueError(line[1], line[3], ans.error()));
    }
    if (!failure.empty()) {
        return std::unexpected(std::move(failure));
    }
    return {};
}

inline std::expected<void, std::string> len(ConsoleApp &app, const Line &) {
    app.out << app.list.size() << std::endl;
    return {};
}

inline std::expected<void, std::string> clear(ConsoleApp &app, const Line &) {
    app.list.clear();
    return {};
}

inline std::expected<void, std::string> print(ConsoleApp &app, const Line &) {
    app.out << app.list.toString(*app.format) << std::endl;
    return {};
}

inline std::expected<void, std::string> types(ConsoleApp &app, const Line &) {
    std::size_t i = 0;
    for (auto &&e : app.list.iter()) {
        app.out << i++ << ": " << e.typeName() << '\n';
    }
    app.out << std::flush;
    return {};
}

inline std::expected<void, std::string> load(ConsoleApp &app, const Line &line) {
    return app.loadScript(std::string(line[1]));
}

inline std::expected<void, std::string> allcfg(ConsoleApp &app, const Line &) {
    std::vector<std::string_view> keys;
    for (auto &&[k, v] : app.cfg.getCallBacks()) {
        keys.push_back(k);
    }
    std::ranges::sort(keys);
    app.out << "available cfg: " << anylist::mystr::join(keys, ", ") << std::endl;
    return {};
}

inline std::expected<void, std::string> showcfg(ConsoleApp &app, const Line &line) {
    auto key = std::string(line[1]);
    if (app.cfg.isKeyListened(key)) {
        app.out << app.cfg.getValue(key) << std::endl;
        return {};
    }
    return std::unexpected("unknown cfg, input \"cfg\" to show all cfg");
}

inline std::expected<void, std::string> editcfg(ConsoleApp &app, const Line &line) {
    return app.setConfig(std::string(line[1]), std::string(line[2]));
}

struct DepthGuard {
    explicit DepthGuard(std::size_t &depth) : depth(depth) { ++depth; }
    ~DepthGuard() { --depth; }
    std::size_t &depth;
};

std::expected<void, std::string> runScript(ConsoleApp &app, const YAML::Node &script, const std::string &file) {
    if (script.IsNull()) {
        return {};
    }
    if (!script.IsMap()) {
        return std::unexpected(file + ": script must be a map");
    }
    if (auto config = script["config"]; config) {
        if (!config.IsMap()) {
            return std::unexpected(file + ": config must be a map");
        }
        for (auto &&kv : config) {
            auto entry = anylist::doWithCatch(
                [&] { return std::make_pair(kv.first.as<std::string>(), kv.second.as<std::string>()); });
            if (!entry) {
                return std::unexpected(file + ": " + entry.error());
            }
            if (auto ans = app.setConfig(entry.value().first, entry.value().second); !ans) {
                return std::unexpected(file + ": " + ans.error());
            }
        }
    }
    auto commands = script["commands"];
    if (!commands) {
        return {};
    }
    if (!commands.IsSequence()) {
        return std::unexpected(file + ": commands must be a sequence");
    }
    std::size_t i = 0;
    for (auto &&n : commands) {
        auto command = anylist::doWithCatch([&] { return n.as<std::string>(); });
        if (!command) {
            return std::unexpected(file + ": command #" + std::to_string(i) + ": " + command.error());
        }
        if (auto ans = app.processCommand(command.value()); !ans) {
            return std::unexpected(file + ": command #" + std::to_string(i) + " \"" + command.value() +
                                   "\": " + ans.error());
        }
        ++i;
    }
    return {};
}

} // namespace

namespace anylist::console {

std::map<std::string, ConsoleApp::Command, std::less<>> ConsoleApp::commandCallbacks{
    {"push", {2, push}},   {"pb", {2, push}},     {"front", {2, front}},  {"pf", {2, front}},
    {"set", {3, replace}}, {"get", {2, get}},     {"add", {3, add}},      {"len", {0, len}},
    {"clear", {0, clear}}, {"print", {0, print}}, {"p", {0, print}},      {"types", {0, types}},
    {"load", {1, load}},   {"l", {1, load}},      {"cfg", {0, allcfg}},   {"getcfg", {1, showcfg}},
    {"setcfg", {2, editcfg}},
};

void ConsoleApp::initCfg(const std::string &cfgFile) {
    cfg.listen("loglevel", [this](auto &arg) {
        if (auto level = parseValue<uint64_t>(arg); level) {
            logger.log_level = static_cast<std::size_t>(level.value());
        } else {
            logger.writeLog("Config", "bad loglevel \"" + arg + "\", keep " + std::to_string(logger.log_level),
                            kError);
        }
    });
    cfg.listen("logfile", [this](auto &arg) {
        if (!logger.openFile(arg)) {
            out << "cannot open log file \"" << arg << "\"" << std::endl;
        }
    });
    cfg.listen("enablelog", [this](auto &arg) {
        if (auto enable = parseValue<bool>(arg); enable) {
            logger.enable_log = enable.value();
        } else {
            logger.writeLog("Config", "bad enablelog \"" + arg + "\"", kError);
        }
    });
    cfg.listen("format", [this](auto &arg) {
        if (auto f = formationByName(arg)) {
            format = f;
        } else {
            logger.writeLog("Config", "unknown format \"" + arg + "\", keep " + std::string(format->name), kError);
        }
    });

    cfg.syncWithFile(cfgFile);

    cfg.setValue("loglevel", std::to_string(logger.log_level));
    cfg.setValue("enablelog", logger.enable_log ? "1" : "0");
    cfg.setValue("format", std::string(format->name));
}

std::expected<void, std::string> ConsoleApp::setConfig(const std::string &key, const std::string &value) {
    if (!cfg.isKeyListened(key)) {
        return std::unexpected("unknown cfg, input \"cfg\" to show all cfg");
    }
    cfg.setValue(key, value);
    logger.writeLog("Config", key + "=" + value, kInfo);
    return {};
}

std::expected<void, std::string> ConsoleApp::loadScript(const std::string &scriptFile) {
    if (scriptDepth >= kMaxScriptDepth) {
        return std::unexpected("script nested too deep when load \"" + scriptFile + "\"");
    }
    auto script = doWithCatch([&] { return YAML::LoadFile(scriptFile); });
    if (!script) {
        return std::unexpected("error when load \"" + scriptFile + "\": " + script.error());
    }
    logger.writeLog("Console", "run script " + scriptFile, kInfo);
    DepthGuard guard{scriptDepth};
    auto ans = runScript(*this, script.value(), scriptFile);
    if (ans) {
        logger.writeLog("Console", "finish script " + scriptFile, kInfo);
    }
    return ans;
}

} // namespace anylist::console
