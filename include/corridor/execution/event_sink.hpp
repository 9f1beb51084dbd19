#pragma once

#include <corridor/schema/event_record.hpp>
#include <functional>

namespace corridor::execution {

using event_sink_t =
    std::function<void(const corridor::schema::event_record_t& record)>;

}  // namespace corridor::execution
