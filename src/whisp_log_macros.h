/**
 * @file whisp_log_macros.h
 * @brief Shared logging macros for the transfer manager sources.
 *
 * In TESTING builds the manager macros embed the `this` pointer so that
 * log lines from different TransferManager instances can be distinguished.
 */

#ifndef WHISP_LOG_MACROS_H
#define WHISP_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_TRANSFER_DEBUG(message) LOG_DEBUG("transfer", "[pointer: " << this << "] " << message)
#define LOG_TRANSFER_INFO(message)  LOG_INFO("transfer", "[pointer: " << this << "] " << message)
#define LOG_TRANSFER_WARN(message)  LOG_WARN("transfer", "[pointer: " << this << "] " << message)
#define LOG_TRANSFER_ERROR(message) LOG_ERROR("transfer", "[pointer: " << this << "] " << message)
#else
#define LOG_TRANSFER_DEBUG(message) LOG_DEBUG("transfer", message)
#define LOG_TRANSFER_INFO(message)  LOG_INFO("transfer", message)
#define LOG_TRANSFER_WARN(message)  LOG_WARN("transfer", message)
#define LOG_TRANSFER_ERROR(message) LOG_ERROR("transfer", message)
#endif

#define LOG_EVENTS_DEBUG(message) LOG_DEBUG("events", message)
#define LOG_EVENTS_INFO(message)  LOG_INFO("events", message)
#define LOG_EVENTS_WARN(message)  LOG_WARN("events", message)
#define LOG_EVENTS_ERROR(message) LOG_ERROR("events", message)

#endif // WHISP_LOG_MACROS_H
