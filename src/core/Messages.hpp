#pragma once

#include <map>
#include <string>
#include <vector>

namespace proclient {

/**
 * @brief A stable message code paired with its human-readable template
 *
 * Templates use {placeholder} fields filled by Messages::format. Control
 * flow branches on codes, never on the wording.
 */
struct NamedMessage {
    const char* code;
    const char* text;
};

namespace Messages {

// Batch-level classification of requested service names
inline constexpr NamedMessage INVALID_SERVICE_OR_FAILURE{
    "invalid-service-or-failure",
    "Cannot {action} unknown service '{name}'.\nSee https://ubuntu.com/pro"};
inline constexpr NamedMessage VALID_SERVICE_FAILURE_UNATTACHED{
    "valid-service-failure-unattached",
    "To use '{name}' you need an Ubuntu Pro subscription\n"
    "Personal and community subscriptions are available at no charge\n"
    "See https://ubuntu.com/pro"};
inline constexpr NamedMessage MIXED_SERVICES_FAILURE_UNATTACHED{"mixed-services-failure-unattached", ""};

// Per-service execution
inline constexpr NamedMessage SERVICE_NOT_AVAILABLE{
    "service-not-available", "{title} is not available for Ubuntu {series}."};
inline constexpr NamedMessage SERVICE_NOT_ENTITLED{
    "service-not-entitled", "This subscription is not entitled to {title}\nSee https://ubuntu.com/pro"};
inline constexpr NamedMessage SERVICE_ALREADY_ENABLED{
    "service-already-enabled", "{title} is already enabled.\nSee: sudo pro status"};
inline constexpr NamedMessage SERVICE_ALREADY_DISABLED{
    "service-already-disabled", "{title} is not currently enabled\nSee: sudo pro status"};
inline constexpr NamedMessage REQUIRED_SERVICE_DISABLED{
    "required-service-disabled", "Cannot enable {title} when {other} is disabled."};
inline constexpr NamedMessage DEPENDENT_SERVICE_ENABLED{
    "dependent-service-enabled", "Cannot disable {title} when {other} is enabled."};
inline constexpr NamedMessage ENABLING_REQUIRED_SERVICE{
    "enabling-required-service", "Enabling required service: {title}"};
inline constexpr NamedMessage DISABLING_DEPENDENT_SERVICE{
    "disabling-dependent-service", "Disabling dependent service: {title}"};
inline constexpr NamedMessage SERVICE_ENTITLEMENT_REMOVED{
    "service-entitlement-removed", "{title} is no longer entitled and has been disabled."};
inline constexpr NamedMessage REBOOT_REQUIRED{
    "reboot-required", "A reboot is required to complete {action} operation."};

// Single-shot actions
inline constexpr NamedMessage ALREADY_ATTACHED{
    "already-attached",
    "This machine is already attached to '{contract}'\n"
    "To use a different subscription first run: sudo pro detach."};
inline constexpr NamedMessage UNATTACHED{
    "unattached", "This machine is not attached to an Ubuntu Pro subscription.\nSee https://ubuntu.com/pro"};
inline constexpr NamedMessage INVALID_TOKEN{"attach-invalid-token", "Invalid token. See https://ubuntu.com/pro"};
inline constexpr NamedMessage JSON_FORMAT_REQUIRE_ASSUME_YES{
    "json-format-require-assume-yes", "json formatted response requires --assume-yes flag."};
inline constexpr NamedMessage PROMPT_DENIED{"prompt-denied", "Operation cancelled by user."};
inline constexpr NamedMessage UNSUPPORTED_AUTO_ATTACH{
    "unsupported-auto-attach",
    "Auto-attach image support is not available on this image\nSee: https://ubuntu.com/pro"};
inline constexpr NamedMessage DETACH_AUTOMATION_FAILURE{
    "detach-automation-failure", "Unable to automatically detach machine"};
inline constexpr NamedMessage BETA_SERVICE_FOUND{"beta-service-found", "beta service found in the enable list"};
inline constexpr NamedMessage FULL_AUTO_ATTACH_ERROR{"full-auto-attach-error", "full_auto_attach was not successful"};
inline constexpr NamedMessage LOCK_HELD{
    "lock-held",
    "Unable to perform: pro {command}.\nOperation in progress: another pro process holds {lock}"};

// Plain (uncoded) user-facing text
inline constexpr const char* NONROOT_USER = "This command must be run as root (try using sudo).";
inline constexpr const char* HELP_NOT_FOUND = "No help available for '{name}'";
inline constexpr const char* ATTACH_REQUIRES_TOKEN =
    "Attach requires a token: sudo pro attach <TOKEN>\nTo obtain a token please visit: https://ubuntu.com/pro";
inline constexpr const char* SERVICE_NAME_REQUIRED =
    "At least one service name is required: sudo pro {action} <service> [<service>]";
inline constexpr const char* SERVICE_ENABLED = "{title} enabled";
inline constexpr const char* SERVICE_DISABLED = "{title} disabled";
inline constexpr const char* ATTACH_SUCCESS = "This machine is now attached to '{contract}'";
inline constexpr const char* DETACH_SUCCESS = "This machine is now detached.";
inline constexpr const char* REATTACHING = "Re-attaching Ubuntu Pro subscription on new instance";
inline constexpr const char* DETACH_WILL_DISABLE = "Detach will disable the following services:";
inline constexpr const char* CONFIRM_PROMPT = "Are you sure? (y/N) ";
inline constexpr const char* REFRESH_CONTRACT_SUCCESS = "Successfully refreshed your subscription.";
inline constexpr const char* REFRESH_CONFIG_SUCCESS = "Successfully processed your pro configuration.";

/// Substitute every {key} in @p tmpl; unknown placeholders are left as-is
std::string format(const std::string& tmpl, const std::map<std::string, std::string>& args);

/// Join clauses with exactly one blank line between them, no trailing blank line
std::string joinClauses(const std::vector<std::string>& clauses);

}

}
