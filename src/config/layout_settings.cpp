#include <oceangraph/config/layout_settings.h>
#include <oceangraph/db/settings_store.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace oceangraph {
namespace config {

namespace {
using LayoutParams = layout::ForceDirectedLayout::LayoutParams;
using BuilderParams = graph::GraphBuilder::BuilderParams;

struct FloatKey { const char* key; float LayoutParams::* member; };
struct IntKey { const char* key; int LayoutParams::* member; };

const FloatKey kLayoutFloatKeys[] = {
    {"layout.link_distance", &LayoutParams::link_distance},
    {"layout.link_weight_ceiling", &LayoutParams::link_weight_ceiling},
    {"layout.charge_strength", &LayoutParams::charge_strength},
    {"layout.charge_theta", &LayoutParams::charge_theta},
    {"layout.charge_distance_min", &LayoutParams::charge_distance_min},
    {"layout.center_strength", &LayoutParams::center_strength},
    {"layout.collision_margin", &LayoutParams::collision_margin},
    {"layout.collision_strength", &LayoutParams::collision_strength},
    {"layout.alpha_initial", &LayoutParams::alpha_initial},
    {"layout.alpha_min", &LayoutParams::alpha_min},
    {"layout.alpha_decay", &LayoutParams::alpha_decay},
    {"layout.velocity_decay", &LayoutParams::velocity_decay},
    {"layout.min_zoom", &LayoutParams::min_zoom},
    {"layout.max_zoom", &LayoutParams::max_zoom},
    {"layout.drag_reheat_alpha", &LayoutParams::drag_reheat_alpha},
    {"layout.initial_radius", &LayoutParams::initial_radius},
};

const IntKey kLayoutIntKeys[] = {
    {"layout.link_iterations", &LayoutParams::link_iterations},
    {"layout.exact_charge_below", &LayoutParams::exact_charge_below},
    {"layout.collision_iterations", &LayoutParams::collision_iterations},
};

std::string FormatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(9) << value;
    return out.str();
}

// Parses the stored value into `target`; leaves it untouched on failure.
template <typename T, typename Parse>
void LoadNumber(db::SettingsStore& store, const std::string& key, T& target, Parse parse) {
    std::optional<std::string> stored = store.loadSetting(key);
    if (!stored) return;
    try {
        size_t consumed = 0;
        T value = parse(*stored, &consumed);
        if (consumed != stored->size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = value;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Ignoring setting " << key << "='" << *stored << "': " << e.what() << std::endl;
    }
}

void LoadFloat(db::SettingsStore& store, const std::string& key, float& target) {
    LoadNumber(store, key, target, [](const std::string& s, size_t* pos) { return std::stof(s, pos); });
}

void LoadDouble(db::SettingsStore& store, const std::string& key, double& target) {
    LoadNumber(store, key, target, [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

void LoadInt(db::SettingsStore& store, const std::string& key, int& target) {
    LoadNumber(store, key, target, [](const std::string& s, size_t* pos) { return std::stoi(s, pos); });
}

void LoadUnsigned(db::SettingsStore& store, const std::string& key, unsigned& target) {
    LoadNumber(store, key, target, [](const std::string& s, size_t* pos) {
        unsigned long value = std::stoul(s, pos);
        return static_cast<unsigned>(value);
    });
}
} // end anonymous namespace

LayoutParams LoadLayoutParams(db::SettingsStore& store) {
    LayoutParams params;
    LoadFloat(store, "layout.canvas_width", params.canvas_size.x);
    LoadFloat(store, "layout.canvas_height", params.canvas_size.y);
    for (const auto& entry : kLayoutFloatKeys) {
        LoadFloat(store, entry.key, params.*(entry.member));
    }
    for (const auto& entry : kLayoutIntKeys) {
        LoadInt(store, entry.key, params.*(entry.member));
    }
    LoadUnsigned(store, "layout.random_seed", params.random_seed);
    return params;
}

void SaveLayoutParams(db::SettingsStore& store, const LayoutParams& params) {
    store.saveSetting("layout.canvas_width", FormatNumber(params.canvas_size.x));
    store.saveSetting("layout.canvas_height", FormatNumber(params.canvas_size.y));
    for (const auto& entry : kLayoutFloatKeys) {
        store.saveSetting(entry.key, FormatNumber(params.*(entry.member)));
    }
    for (const auto& entry : kLayoutIntKeys) {
        store.saveSetting(entry.key, std::to_string(params.*(entry.member)));
    }
    store.saveSetting("layout.random_seed", std::to_string(params.random_seed));
}

BuilderParams LoadBuilderParams(db::SettingsStore& store) {
    BuilderParams params;
    LoadDouble(store, "builder.parameter_scale", params.parameter_scale);
    LoadDouble(store, "builder.biology_scale", params.biology_scale);
    LoadFloat(store, "builder.min_weight", params.min_weight);
    LoadFloat(store, "builder.max_weight", params.max_weight);
    return params;
}

void SaveBuilderParams(db::SettingsStore& store, const BuilderParams& params) {
    store.saveSetting("builder.parameter_scale", FormatNumber(params.parameter_scale));
    store.saveSetting("builder.biology_scale", FormatNumber(params.biology_scale));
    store.saveSetting("builder.min_weight", FormatNumber(params.min_weight));
    store.saveSetting("builder.max_weight", FormatNumber(params.max_weight));
}

} // namespace config
} // namespace oceangraph
