 /**
 * @file bridgelink_log_macros.h
 * @brief Logging macros shared by the stateful bridgelink components.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different discovery / resolver instances created by
 * the same test binary can be told apart.
 */

#ifndef BRIDGELINK_LOG_MACROS_H
#define BRIDGELINK_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_DISCOVERY_DEBUG(message) LOG_DEBUG("discovery", "[pointer: " << this << "] " << message)
#define LOG_DISCOVERY_INFO(message)  LOG_INFO("discovery", "[pointer: " << this << "] " << message)
#define LOG_DISCOVERY_WARN(message)  LOG_WARN("discovery", "[pointer: " << this << "] " << message)
#define LOG_DISCOVERY_ERROR(message) LOG_ERROR("discovery", "[pointer: " << this << "] " << message)

#define LOG_ENDPOINT_DEBUG(message) LOG_DEBUG("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_INFO(message)  LOG_INFO("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_WARN(message)  LOG_WARN("endpoint", "[pointer: " << this << "] " << message)
#define LOG_ENDPOINT_ERROR(message) LOG_ERROR("endpoint", "[pointer: " << this << "] " << message)
#else
#define LOG_DISCOVERY_DEBUG(message) LOG_DEBUG("discovery", message)
#define LOG_DISCOVERY_INFO(message)  LOG_INFO("discovery", message)
#define LOG_DISCOVERY_WARN(message)  LOG_WARN("discovery", message)
#define LOG_DISCOVERY_ERROR(message) LOG_ERROR("discovery", message)

#define LOG_ENDPOINT_DEBUG(message) LOG_DEBUG("endpoint", message)
#define LOG_ENDPOINT_INFO(message)  LOG_INFO("endpoint", message)
#define LOG_ENDPOINT_WARN(message)  LOG_WARN("endpoint", message)
#define LOG_ENDPOINT_ERROR(message) LOG_ERROR("endpoint", message)
#endif

#endif // BRIDGELINK_LOG_MACROS_H
