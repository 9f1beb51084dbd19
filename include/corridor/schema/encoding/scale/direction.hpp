#pragma once

#include <corridor/schema/direction.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(corridor::schema,
                             direction_t,
                             corridor::schema::direction_t::leg0_to_leg1,
                             corridor::schema::direction_t::leg1_to_leg0)
