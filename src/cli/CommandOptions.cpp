#include "cli/CommandOptions.hpp"

namespace proclient {

static Expected<OutputFormat> parseFormat(const std::string& value) {
    if (value == "json") return OutputFormat::Json;
    if (value == "text") return OutputFormat::Text;
    return Error{ErrorCode::InvalidArgs, "argument --format: invalid choice: '" + value + "' (choose from 'json', 'text')"};
}

static Expected<int> parseRetries(const std::string& value) {
    bool digits = !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
    if (!digits || value.size() > 6) {
        return Error{ErrorCode::InvalidArgs, "argument --retries: invalid int value: '" + value + "'"};
    }
    return std::stoi(value);
}

static bool takesValue(const std::string& flag) {
    return flag == "--format" || flag == "--enable" || flag == "--enable-beta" || flag == "--retries";
}

Expected<CommandOptions> parseCommandOptions(const std::vector<std::string>& args, const std::set<std::string>& accepted) {
    CommandOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.size() < 2 || a.compare(0, 2, "--") != 0) {
            opts.positional.push_back(a);
            continue;
        }

        std::string flag = a;
        std::string value;
        bool hasValue = false;
        size_t eq = a.find('=');
        if (eq != std::string::npos) {
            flag = a.substr(0, eq);
            value = a.substr(eq + 1);
            hasValue = true;
        }
        if (!accepted.count(flag)) {
            return Error{ErrorCode::InvalidArgs, "unrecognized arguments: " + a};
        }

        if (takesValue(flag)) {
            if (!hasValue) {
                if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "argument " + flag + ": expected one argument"};
                value = args[++i];
            }
            if (flag == "--format") {
                auto fmt = parseFormat(value);
                if (!fmt) return fmt.error();
                opts.format = fmt.value();
            } else if (flag == "--retries") {
                auto n = parseRetries(value);
                if (!n) return n.error();
                opts.retries = n.value();
            } else if (flag == "--enable") {
                opts.enable.push_back(value);
            } else {
                opts.enableBeta.push_back(value);
            }
        } else if (hasValue) {
            return Error{ErrorCode::InvalidArgs, "argument " + flag + ": ignored explicit argument '" + value + "'"};
        } else if (flag == "--assume-yes") {
            opts.assumeYes = true;
        } else if (flag == "--beta") {
            opts.beta = true;
        } else if (flag == "--all") {
            opts.all = true;
        } else if (flag == "--no-auto-enable") {
            opts.noAutoEnable = true;
        }
    }
    return opts;
}

}
