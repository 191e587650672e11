#include "Layout.h"

namespace ll
{
namespace Layout
{

namespace
{

constexpr int sidebarWidth = 20;
constexpr int topBarHeight = 1;
constexpr int bottomBarHeight = 1;
constexpr int connectionsHeight = 12;
constexpr int queryHeight = 6;

std::unique_ptr<Box> makeBox (BoxKind kind, const juce::String& name, Rect bounds,
                              Registers* registers, EditingMode mode)
{
    auto box = std::make_unique<Box> (kind, name, bounds);

    if (registers != nullptr)
        box->enableEditing (*registers);

    box->setEditingMode (mode);
    return box;
}

} // namespace

std::vector<std::unique_ptr<Pane>> createDefaultPanes (Registers& registers, EditingMode mode)
{
    const int mainWidth = gridWidth - sidebarWidth;
    const int bodyHeight = gridHeight - topBarHeight - bottomBarHeight;

    const Rect connectionsArea (0, topBarHeight, sidebarWidth, connectionsHeight);
    const Rect schemaArea (0, connectionsArea.bottom(), sidebarWidth, bodyHeight - connectionsHeight);
    const Rect queryArea (sidebarWidth, topBarHeight, mainWidth, queryHeight);
    const Rect resultsArea (sidebarWidth, queryArea.bottom(), mainWidth, bodyHeight - queryHeight);
    const Rect commandArea (0, gridHeight - bottomBarHeight, gridWidth, bottomBarHeight);

    std::vector<std::unique_ptr<Pane>> panes;

    auto connections = std::make_unique<Pane> (PaneKind::Connections, connectionsArea);
    connections->addBox (makeBox (BoxKind::TreeView, "connections", connectionsArea, nullptr, mode));

    auto query = std::make_unique<Pane> (PaneKind::QueryInput, queryArea);
    query->addBox (makeBox (BoxKind::TextInput, "query", queryArea, &registers, mode));

    auto results = std::make_unique<Pane> (PaneKind::Results, resultsArea);
    results->addBox (makeBox (BoxKind::DataTable, "results", resultsArea, &registers, mode));

    // Tables above their columns
    const int treeHeight = schemaArea.height / 2;
    const Rect treeArea (schemaArea.x, schemaArea.y, schemaArea.width, treeHeight);
    const Rect listArea (schemaArea.x, treeArea.bottom(), schemaArea.width, schemaArea.height - treeHeight);

    auto schema = std::make_unique<Pane> (PaneKind::SchemaExplorer, schemaArea);
    schema->addBox (makeBox (BoxKind::TreeView, "tables", treeArea, nullptr, mode));
    schema->addBox (makeBox (BoxKind::ListView, "columns", listArea, nullptr, mode));

    auto command = std::make_unique<Pane> (PaneKind::CommandLine, commandArea);

    panes.push_back (std::move (connections));
    panes.push_back (std::move (query));
    panes.push_back (std::move (results));
    panes.push_back (std::move (schema));
    panes.push_back (std::move (command));

    return panes;
}

} // namespace Layout
} // namespace ll
