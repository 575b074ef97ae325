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
#pragma once

#include "../kinematics/space.h"

#include <toml.hpp>

#include <cstdint>
#include <string>

namespace astro
{

/**
 * @brief Settings for the astro_demo executable
 */
struct DemoConfig
{
    kinematics::SpaceConfig space;

    double          tickInterval    {0.1};      ///< seconds
    std::uint32_t   tickCount       {50};
    std::string     logLevel        {"info"};
};

/**
 * @brief Read the [kinematics] table. Missing keys keep their defaults.
 *
 * @throws std::invalid_argument for out-of-range values
 */
kinematics::SpaceConfig load_space_config(toml::value const& root);

/**
 * @brief Read the [kinematics] and [demo] tables
 *
 * @throws std::invalid_argument for out-of-range values
 */
DemoConfig load_demo_config(toml::value const& root);

/**
 * @brief Parse a TOML file and read it with load_demo_config
 *
 * toml11's exceptions propagate for unreadable or malformed files.
 */
DemoConfig load_demo_config_file(std::string const& path);

} // namespace astro
