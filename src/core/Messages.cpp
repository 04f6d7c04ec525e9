#include "core/Messages.hpp"

namespace proclient::Messages {

std::string format(const std::string& tmpl, const std::map<std::string, std::string>& args) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) break;
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) break;
        out.append(tmpl, pos, open - pos);
        auto it = args.find(tmpl.substr(open + 1, close - open - 1));
        if (it != args.end()) {
            out += it->second;
        } else {
            out.append(tmpl, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string joinClauses(const std::vector<std::string>& clauses) {
    std::string out;
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += clauses[i];
    }
    return out;
}

}
