#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/AppContext.hpp"
#include "core/ActionExecutor.hpp"
#include "core/Messages.hpp"
#include "core/Operation.hpp"
#include "util/Expected.hpp"
#include "util/FileLock.hpp"

namespace proclient {

/**
 * @brief Helpers shared by the mutating subcommands
 */
namespace CommandSupport {

/**
 * @brief Report a batch-level failure in the requested format
 *
 * JSON: an operation result holding the single system error on stdout.
 * Text: the message on stderr. Returns the (already rendered) failure.
 */
Error reportSystemError(const NamedMessage& msg, const std::map<std::string, std::string>& args, OutputFormat format);

/// Take the client lock for @p command; a held lock is reported and fails
Expected<std::unique_ptr<FileLock>> acquireLock(const AppContext& ctx, const std::string& command, OutputFormat format);

/// Ask "Are you sure? (y/N)"; only y/yes (any case) confirms
bool confirm(const AppContext& ctx);

/// Render @p result and turn it into the command's return value
Expected<void> finish(const OperationResult& result, Action action, OutputFormat format, const AppContext& ctx);

/**
 * @brief Shared body of enable/disable
 *
 * Parses names and flags, enforces --assume-yes for JSON output, takes the
 * lock, resolves the batch against the stored attachment state, persists
 * the state if it changed and renders the result.
 */
Expected<void> runServiceBatch(Action action, const AppContext& ctx, const std::vector<std::string>& args);

/// Fresh attached state for @p contract, stamped with this machine's id and the current time
AttachmentState newAttachment(const AppContext& ctx, const std::string& token, const Contract& contract);

/// Enable the contract's default services in enable order; ones not offered on this release are skipped
ExecutionReport enableDefaults(const AppContext& ctx, const Contract& contract, AttachmentState& state);

/// Disable every enabled service, dependents first
ExecutionReport disableAll(const AppContext& ctx, AttachmentState& state);

/// Current time as ISO-8601 UTC
std::string utcNow();

}

}
