/// @file ot.hpp
/// @brief Umbrella header for the ot-cpp library.
///
/// Include this single header for access to all public types:
/// Operation, the transform engine, RevisionLog, DocumentState,
/// SyncController, Session, CollaborationService, capabilities,
/// checkpoints and Error.

#pragma once

#include <ot-cpp/capability.hpp>
#include <ot-cpp/checkpoint.hpp>
#include <ot-cpp/collaboration_service.hpp>
#include <ot-cpp/cursor.hpp>
#include <ot-cpp/document_state.hpp>
#include <ot-cpp/error.hpp>
#include <ot-cpp/json.hpp>
#include <ot-cpp/logging.hpp>
#include <ot-cpp/messages.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/options.hpp>
#include <ot-cpp/revision_log.hpp>
#include <ot-cpp/session.hpp>
#include <ot-cpp/sync_controller.hpp>
#include <ot-cpp/transform.hpp>
#include <ot-cpp/types.hpp>
