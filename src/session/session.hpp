/*
 * session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file session.hpp
 * @brief Aggregate header for the session subsystem
 * @date 2024
 * @version 1.0.0
 */

#ifndef TANDEM_SESSION_SESSION_HPP
#define TANDEM_SESSION_SESSION_HPP

#include "types.hpp"
#include "report.hpp"
#include "orchestrator.hpp"

#include "completion/completion_coordinator.hpp"
#include "process/process_controller.hpp"
#include "signal/signal_channel.hpp"
#include "store/session_store.hpp"

#endif  // TANDEM_SESSION_SESSION_HPP
