#include "IndicatorConfig.hpp"
#include "../Log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace tdchart::IndicatorConfig {

namespace {

constexpr const char* kLogCat = "config";

std::string readColor(const nlohmann::json& colors, const char* key, const std::string& fallback) {
    if (!colors.contains(key)) return fallback;
    const auto& value = colors.at(key);
    if (!value.is_string() || !isValidHexColor(value.get<std::string>())) {
        throw IndicatorConfigError(fmt::format("colors.{} must be a hex color string", key));
    }
    return value.get<std::string>();
}

TdSetupOptions applyEntry(const nlohmann::json& entry, TdSetupOptions options) {
    if (entry.contains("shortName")) {
        options.shortName = entry.at("shortName").get<std::string>();
    }
    if (entry.contains("closeOnly")) {
        const bool closeOnly = entry.at("closeOnly").get<bool>();
        if (closeOnly != options.variant.closeOnly) {
            options.colors = defaultColors(closeOnly);
        }
        options.variant.closeOnly = closeOnly;
    }
    if (entry.contains("emit")) {
        const auto text = entry.at("emit").get<std::string>();
        auto mode = emitModeFromString(text);
        if (!mode) {
            throw IndicatorConfigError(fmt::format("unknown emit mode '{}' for indicator {}", text, options.name));
        }
        options.variant.emit = *mode;
    }
    if (entry.contains("colors")) {
        const auto& colors = entry.at("colors");
        if (!colors.is_object()) {
            throw IndicatorConfigError(fmt::format("colors of indicator {} must be an object", options.name));
        }
        options.colors.sell = readColor(colors, "sell", options.colors.sell);
        options.colors.buy = readColor(colors, "buy", options.colors.buy);
        options.colors.highlight = readColor(colors, "highlight", options.colors.highlight);
    }
    if (options.shortName.empty()) {
        options.shortName = options.name;
    }
    return options;
}

} // namespace

TdSetupColors defaultColors(bool closeOnly) {
    TdSetupColors colors;
    if (closeOnly) {
        colors.sell = "#fb7185";
        colors.buy = "#60a5fa";
    }
    return colors;
}

std::vector<TdSetupOptions> defaultTdSetupOptions() {
    TdSetupOptions rangeAware;
    rangeAware.name = kRangeAwareName;
    rangeAware.shortName = "TD Setup";
    rangeAware.variant = {false, EmitMode::Count};
    rangeAware.colors = defaultColors(false);

    TdSetupOptions closeOnly;
    closeOnly.name = kCloseOnlyName;
    closeOnly.shortName = "TD Setup Close";
    closeOnly.variant = {true, EmitMode::Count};
    closeOnly.colors = defaultColors(true);

    return {rangeAware, closeOnly};
}

bool isValidHexColor(std::string_view text) {
    if (text.size() != 7 && text.size() != 9) return false;
    if (text.front() != '#') return false;
    return std::all_of(text.begin() + 1, text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

std::vector<TdSetupOptions> parse(std::string_view json) {
    auto options = defaultTdSetupOptions();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw IndicatorConfigError(fmt::format("invalid indicator config JSON: {}", e.what()));
    }

    if (!document.is_object()) {
        throw IndicatorConfigError("indicator config root must be an object");
    }
    if (!document.contains("indicators")) {
        LOG_D(kLogCat, "no 'indicators' key, using built-in catalog");
        return options;
    }

    const auto& entries = document.at("indicators");
    if (!entries.is_array()) {
        throw IndicatorConfigError("'indicators' must be an array");
    }

    try {
        for (const auto& entry : entries) {
            if (!entry.is_object() || !entry.contains("name") || !entry.at("name").is_string()) {
                throw IndicatorConfigError("each indicator entry needs a string 'name'");
            }
            const auto name = entry.at("name").get<std::string>();
            if (name.empty()) {
                throw IndicatorConfigError("indicator name must not be empty");
            }

            auto existing = std::find_if(options.begin(), options.end(),
                                         [&](const TdSetupOptions& o) { return o.name == name; });
            if (existing != options.end()) {
                *existing = applyEntry(entry, *existing);
                LOG_D(kLogCat, "indicator {} overridden from config", name);
                continue;
            }

            TdSetupOptions added;
            added.name = name;
            added.variant.closeOnly = entry.value("closeOnly", false);
            added.colors = defaultColors(added.variant.closeOnly);
            options.push_back(applyEntry(entry, added));
            LOG_D(kLogCat, "indicator {} added from config", name);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw IndicatorConfigError(fmt::format("indicator config has a field of the wrong type: {}", e.what()));
    }

    return options;
}

std::vector<TdSetupOptions> loadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IndicatorConfigError(fmt::format("cannot open indicator config {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto options = parse(buffer.str());
    LOG_I(kLogCat, "loaded {} indicator definitions from {}", options.size(), path.string());
    return options;
}

} // namespace tdchart::IndicatorConfig
