#include "PaneManifest.hpp"
#include "Log.hpp"
#include <cmath>
#include <fstream>
#include <sstream>

size_t ManifestParseResult::paneCount() const {
    size_t count = 0;
    for (const auto& g : groups) count += g.panes.size();
    return count;
}

std::optional<PaneDescription> PaneManifest::parsePane(const nlohmann::json& p, const std::string& where,
                                                       std::vector<std::string>& errors) {
    if (!p.is_object()) {
        errors.emplace_back(fmt::format("{}: pane entry is not an object", where));
        return std::nullopt;
    }
    if (!p.contains("title") || !p["title"].is_string()) {
        errors.emplace_back(fmt::format("{}: missing string 'title'", where));
        return std::nullopt;
    }

    PaneDescription pane;
    pane.title = p["title"].get<std::string>();
    pane.tabLabel = pane.title;
    if (p.contains("tabLabel")) {
        if (p["tabLabel"].is_string()) {
            pane.tabLabel = p["tabLabel"].get<std::string>();
        } else {
            errors.emplace_back(fmt::format("{}: 'tabLabel' is not a string, using title", where));
        }
    }

    if (p.contains("contentSize")) {
        const auto& size = p["contentSize"];
        if (size.is_number() && std::isfinite(size.get<double>()) && size.get<double>() > 0.0) {
            pane.contentSize = size.get<double>();
        } else {
            errors.emplace_back(fmt::format("{}: 'contentSize' must be a positive number, using default", where));
        }
    }

    if (p.contains("allowClose")) {
        if (p["allowClose"].is_boolean()) {
            pane.allowClose = p["allowClose"].get<bool>();
        } else {
            errors.emplace_back(fmt::format("{}: 'allowClose' is not a boolean, keeping true", where));
        }
    }

    if (p.contains("fields")) {
        if (p["fields"].is_array()) {
            size_t fieldIndex = 0;
            for (const auto& f : p["fields"]) {
                if (f.is_string()) {
                    pane.fields.emplace_back(f.get<std::string>());
                } else {
                    errors.emplace_back(fmt::format("{}.fields[{}]: not a string, skipped", where, fieldIndex));
                }
                ++fieldIndex;
            }
        } else {
            errors.emplace_back(fmt::format("{}: 'fields' is not an array, using no fields", where));
        }
    }

    return pane;
}

ManifestParseResult PaneManifest::parse(const nlohmann::json& j) {
    ManifestParseResult out;
    if (!j.is_object() || !j.contains("groups") || !j["groups"].is_array()) {
        out.errors.emplace_back("manifest: expected an object with a 'groups' array");
        return out;
    }

    size_t groupIndex = 0;
    for (const auto& g : j["groups"]) {
        const std::string groupWhere = fmt::format("groups[{}]", groupIndex++);
        if (!g.is_object() || !g.contains("panes") || !g["panes"].is_array()) {
            out.errors.emplace_back(fmt::format("{}: expected an object with a 'panes' array", groupWhere));
            continue;
        }

        GroupDescription group;
        size_t paneIndex = 0;
        for (const auto& p : g["panes"]) {
            const std::string where = fmt::format("{}.panes[{}]", groupWhere, paneIndex++);
            if (auto pane = parsePane(p, where, out.errors)) {
                group.panes.push_back(std::move(*pane));
            }
        }

        // An empty group would collapse as soon as it is shown
        if (group.panes.empty()) {
            out.errors.emplace_back(fmt::format("{}: no usable panes, group skipped", groupWhere));
            continue;
        }
        out.groups.push_back(std::move(group));
    }

    for (const auto& e : out.errors) {
        LOG_W("manifest", "{}", e);
    }
    LOG_D("manifest", "parsed {} groups, {} panes", out.groups.size(), out.paneCount());
    return out;
}

ManifestParseResult PaneManifest::parseText(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        ManifestParseResult out;
        out.errors.emplace_back("manifest: invalid JSON");
        LOG_W("manifest", "{}", out.errors.back());
        return out;
    }
    return parse(j);
}

ManifestParseResult PaneManifest::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        ManifestParseResult out;
        out.errors.emplace_back(fmt::format("manifest: cannot open '{}'", path));
        LOG_E("manifest", "{}", out.errors.back());
        return out;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    LOG_I("manifest", "loading workspace from {}", path);
    return parseText(ss.str());
}

nlohmann::json PaneManifest::defaultWorkspace() {
    return {
        {"groups", {
            {{"panes", {
                {{"title", "Explorer"}, {"tabLabel", "Files"}, {"contentSize", 240},
                 {"allowClose", false}, {"fields", nlohmann::json::array({"Filter", "Path"})}},
                {{"title", "Search"}, {"fields", nlohmann::json::array({"Find", "Replace"})}},
            }}},
            {{"panes", {
                {{"title", "Properties"}, {"fields", nlohmann::json::array({"Name", "Width", "Height"})}},
                {{"title", "Notes"}, {"contentSize", 300}, {"fields", nlohmann::json::array({"Note"})}},
                {{"title", "Output"}},
            }}},
        }},
    };
}
