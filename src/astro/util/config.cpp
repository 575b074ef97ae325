/**
 * Open Space Program
 * Copyright © 2019-2023 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include "config.h"
#include "logging.h"

#include <limits>
#include <stdexcept>

using namespace astro;

namespace
{

toml::value const* find_table(toml::value const& root, std::string const& key)
{
    if ( ! root.is_table() )
    {
        return nullptr;
    }

    auto const& table = root.as_table();
    auto const  it    = table.find(key);

    return (it != table.end() && it->second.is_table()) ? &it->second : nullptr;
}

} // namespace

kinematics::SpaceConfig astro::load_space_config(toml::value const& root)
{
    kinematics::SpaceConfig out;

    toml::value const* pKinematics = find_table(root, "kinematics");
    if (pKinematics == nullptr)
    {
        return out;
    }

    auto const capacity = toml::find_or<std::int64_t>(*pKinematics, "slot_capacity", std::int64_t(out.slotCapacity));
    if (capacity < 0)
    {
        throw std::invalid_argument("kinematics.slot_capacity must not be negative");
    }

    double const tolerance = toml::find_or<double>(*pKinematics, "quaternion_tolerance", double{out.quatTolerance});
    if ( ! (tolerance > 0.0 && tolerance < 1.0) )
    {
        throw std::invalid_argument("kinematics.quaternion_tolerance must be in (0, 1)");
    }

    out.slotCapacity  = std::size_t(capacity);
    out.quatTolerance = tolerance;
    return out;
}

DemoConfig astro::load_demo_config(toml::value const& root)
{
    DemoConfig out;
    out.space = load_space_config(root);

    toml::value const* pDemo = find_table(root, "demo");
    if (pDemo == nullptr)
    {
        return out;
    }

    double const interval = toml::find_or<double>(*pDemo, "tick_interval", double{out.tickInterval});
    if ( ! (interval > 0.0) )
    {
        throw std::invalid_argument("demo.tick_interval must be positive");
    }

    auto const count = toml::find_or<std::int64_t>(*pDemo, "tick_count", std::int64_t(out.tickCount));
    if (count < 0 || count > std::int64_t(std::numeric_limits<std::uint32_t>::max()))
    {
        throw std::invalid_argument("demo.tick_count must be in [0, 4294967295]");
    }

    std::string const logLevel = toml::find_or<std::string>(*pDemo, "log_level", std::string{out.logLevel});

    // from_str gives 'off' for names it doesn't know
    if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off")
    {
        throw std::invalid_argument("demo.log_level '" + logLevel + "' is not a log level");
    }

    out.tickInterval = interval;
    out.tickCount    = std::uint32_t(count);
    out.logLevel     = logLevel;
    return out;
}

DemoConfig astro::load_demo_config_file(std::string const& path)
{
    toml::value const data = toml::parse(path);
    DemoConfig out = load_demo_config(data);

    ASTRO_LOG_INFO("Loaded config {}: capacity {}, tick {}s x {}",
                   path, out.space.slotCapacity, out.tickInterval, out.tickCount);
    return out;
}
