// Fuzz target for IRC frame parsing and sanitization
// Every parsed frame must survive sanitize + serialize, and the result must
// parse back without violating the relay's output guarantees

#include "irc/message.hpp"
#include "irc/protocol.hpp"
#include "relay/sanitizer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace ircguard;

    if (size > protocol::MAX_FRAME_LENGTH) {
        return 0;
    }
    std::string line(reinterpret_cast<const char *>(data), size);
    // The decoder splits frames on LF, so a frame never contains one
    line = line.substr(0, line.find('\n'));

    auto msg = irc::ParseMessage(line);
    if (!msg) {
        return 0;
    }

    const auto param_count = msg->params.size();
    auto ec = relay::SanitizeMessage(relay::DefaultRuleTable(), *msg);

    // Sanitizing never adds or drops parameters
    if (msg->params.size() != param_count) {
        __builtin_trap();
    }

    if (ec) {
        return 0;
    }

    // Sender identifier is inside the identifier alphabet
    if (msg->prefix) {
        for (char c : msg->prefix->user) {
            if (!relay::IsIdentifierChar(c)) {
                __builtin_trap();
            }
        }
    }

    auto rule = relay::DefaultRuleTable().find(msg->command);
    if (rule != relay::DefaultRuleTable().end()) {
        if (rule->second == relay::RuleKind::IDENTIFIER) {
            for (char c : msg->params[0]) {
                if (!relay::IsIdentifierChar(c)) {
                    __builtin_trap();
                }
            }
        } else if (msg->params[1].size() > protocol::MAX_BODY_LENGTH) {
            __builtin_trap();
        }
    }

    // Normalization is idempotent
    if (!msg->params.empty() && relay::NormalizeIdentifier(relay::NormalizeIdentifier(msg->params[0])) !=
                                    relay::NormalizeIdentifier(msg->params[0])) {
        __builtin_trap();
    }

    // Serialized output never carries a line break and always has a command
    std::string wire = irc::SerializeMessage(*msg);
    if (wire.find('\n') != std::string::npos) {
        __builtin_trap();
    }
    (void)irc::ParseMessage(wire);

    return 0;
}
