#pragma once

#include <flywheel/schema/campaign_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(flywheel::schema,
                             campaign_status_t,
                             flywheel::schema::campaign_status_t::inactive,
                             flywheel::schema::campaign_status_t::active,
                             flywheel::schema::campaign_status_t::finalizing,
                             flywheel::schema::campaign_status_t::finalized)
