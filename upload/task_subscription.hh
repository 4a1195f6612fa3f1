/*
 * Copyright (C) 2026-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <functional>
#include <boost/signals2/dummy_mutex.hpp>
#include <boost/signals2/signal_type.hpp>

namespace bs2 = boost::signals2;

namespace upload {

struct upload_task;

using task_signal_type = bs2::signal_type<void(const upload_task&), bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;
using task_signal_callback_type = std::function<void(const upload_task&)>;
using task_signal_connection_type = boost::signals2::scoped_connection;

} // namespace upload
