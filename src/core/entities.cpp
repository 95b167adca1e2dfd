#include "gradostroi/core/entities.h"

namespace gradostroi {

const std::array<BuildingType, kBuildingTypeCount>& all_building_types() {
  static const std::array<BuildingType, kBuildingTypeCount> kAll = {
      BuildingType::Sawmill, BuildingType::Herbalist, BuildingType::Quarry,
      BuildingType::Farm,    BuildingType::SandPit,   BuildingType::ClayPit,
  };
  return kAll;
}

} // namespace gradostroi
