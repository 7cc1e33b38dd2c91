#pragma once

namespace AntSim {

using WeightType = float;

} // namespace AntSim
