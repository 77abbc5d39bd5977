/**
 * @file config.hpp
 * @brief key=value configuration file with change listeners
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <algorithm>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "anylist/stringprocess.hpp"

namespace anylist::console {

struct Config {
    /**
     * @brief read values from file, later setValue calls write back to it
     *
     * @attention blank lines, lines without '=' and lines starting with '#' are ignored
     *
     * @param filePath ini file, missing file is treated as empty
     */
    void syncWithFile(const std::string &filePath) {
        data.clear();
        if (auto ifs = std::ifstream(filePath); ifs) {
            std::string lineBuffer;
            while (std::getline(ifs, lineBuffer)) {
                std::string_view line = mystr::removeSpaceView(lineBuffer);
                if (line.empty() || line.front() == '#') {
                    continue;
                }
                auto p = line.find_first_of('=');
                if (p == std::string_view::npos) {
                    continue;
                }
                auto key = mystr::removeSpaceView(line.substr(0, p));
                auto value = mystr::removeSpaceView(line.substr(p + 1));
                if (key.empty()) {
                    continue;
                }
                setValueWithoutWriteFile(std::string(key), std::string(value));
            }
        }
        path = filePath;
        writeFile();
    }

    /**
     * @brief register a callback on key, called at once if key already has a value
     *
     */
    void listen(const std::string &key, std::function<void(const std::string &)> f) {
        if (auto it = data.find(key); it != data.end()) {
            f(it->second);
        }
        callbacks[key].push_back(std::move(f));
    }

    void setValue(const std::string &key, std::string value) {
        setValueWithoutWriteFile(key, std::move(value));
        writeFile();
    }

    bool isKeyListened(const std::string &key) const { return callbacks.contains(key); }

    const std::string &getValue(const std::string &key) const {
        auto it = data.find(key);
        if (it == data.end()) {
            static const std::string fallback = "[unspecified]";
            return fallback;
        }
        return it->second;
    }

    const std::unordered_map<std::string, std::vector<std::function<void(const std::string &)>>> &
    getCallBacks() const {
        return callbacks;
    }

  private:
    void setValueWithoutWriteFile(const std::string &key, std::string value) {
        data[key] = std::move(value);
        auto it = callbacks.find(key);
        if (it == callbacks.end()) {
            return;
        }
        std::ranges::for_each(it->second, [&v = data[key]](auto &fun) { fun(v); });
    }

    void writeFile() {
        if (path.empty()) {
            return;
        }
        std::vector<std::pair<std::string_view, std::string_view>> sorted(data.begin(), data.end());
        std::ranges::sort(sorted);
        if (auto f = std::ofstream{path, std::ios::trunc}; f) {
            for (auto &&[k, v] : sorted) {
                f << k << '=' << v << '\n';
            }
        }
    }

    std::string path;
    std::unordered_map<std::string, std::string> data;
    std::unordered_map<std::string, std::vector<std::function<void(const std::string &)>>> callbacks;
};

} // namespace anylist::console
