#ifndef OCEANGRAPH_CONFIG_LAYOUT_SETTINGS_H
#define OCEANGRAPH_CONFIG_LAYOUT_SETTINGS_H

#include <oceangraph/graph/graph_builder.h>
#include <oceangraph/layout/force_directed_layout.h>

namespace oceangraph {
namespace db {
class SettingsStore;
} // namespace db

namespace config {

// Stored tuning values live under "layout.<name>" and "builder.<name>".
// Missing keys keep their defaults; unparsable values keep their defaults and
// print a warning to stderr.
layout::ForceDirectedLayout::LayoutParams LoadLayoutParams(db::SettingsStore& store);
void SaveLayoutParams(db::SettingsStore& store, const layout::ForceDirectedLayout::LayoutParams& params);

graph::GraphBuilder::BuilderParams LoadBuilderParams(db::SettingsStore& store);
void SaveBuilderParams(db::SettingsStore& store, const graph::GraphBuilder::BuilderParams& params);

} // namespace config
} // namespace oceangraph

#endif // OCEANGRAPH_CONFIG_LAYOUT_SETTINGS_H
