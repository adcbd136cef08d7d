#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/*
DockKit — PaneManifest
Role: Describe a workspace (groups of panes) in JSON for hosts and the demo app.
Errors never throw; every rejected entry leaves a message in ManifestParseResult::errors.
*/

struct PaneDescription {
    std::string title;
    std::string tabLabel;                 // mirrors title when absent
    std::optional<double> contentSize;    // unset: pane default
    bool allowClose = true;
    std::vector<std::string> fields;      // one input per field in the demo content
};

struct GroupDescription {
    std::vector<PaneDescription> panes;
};

struct ManifestParseResult {
    std::vector<GroupDescription> groups;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
    size_t paneCount() const;
};

class PaneManifest {
public:
    static ManifestParseResult parse(const nlohmann::json& j);
    static ManifestParseResult parseText(const std::string& text);
    static ManifestParseResult loadFile(const std::string& path);

    /// Built-in workspace used when no manifest is given
    static nlohmann::json defaultWorkspace();

private:
    static std::optional<PaneDescription> parsePane(const nlohmann::json& p, const std::string& where,
                                                    std::vector<std::string>& errors);
};
