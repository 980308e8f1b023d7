// include/modules.hh
#ifndef MODULES_HH
#define MODULES_HH

#include "modules/radio_unit.hh"
#include "modules/distributed_unit.hh"
#include "modules/cu_control_plane.hh"
#include "modules/cu_user_plane.hh"
#include "modules/user_terminal.hh"

// Scenario "type" names of the built-in elements
#define REGISTER_ELEMENTS \
    ModuleFactory::registerObject<RadioUnit>("o_ru"); \
    ModuleFactory::registerObject<DistributedUnit>("o_du"); \
    ModuleFactory::registerObject<CuControlPlane>("o_cu_cp"); \
    ModuleFactory::registerObject<CuUserPlane>("o_cu_up"); \
    ModuleFactory::registerObject<UserTerminal>("ue");

#endif // MODULES_HH
