#include "CommandAllowlist.h"
#include "InputSanitizer.h"

#include <algorithm>
#include <stdexcept>

namespace ConsoleGate {

namespace {

    const std::vector<std::string>& builtinEntries() {
        static const std::vector<std::string> table = {
            // Auth
            "auth login",
            "auth logout",
            "auth status",
            "auth whoami",
            "auth list",
            "auth show",
            "auth switch",
            "auth add",
            "auth remove",
            "auth revoke",
            "auth config",
            "auth providers",
            "auth detect",
            "auth scopes",
            "auth token",
            "auth migrate",

            // Email
            "email list",
            "email read",
            "email send",
            "email search",
            "email delete",
            "email mark",
            "email drafts",
            "email folders",
            "email threads",
            "email scheduled",
            "email attachments",
            "email metadata",
            "email tracking-info",
            "email ai",
            "email smart-compose",
            "email folders list",
            "email folders show",
            "email folders create",
            "email folders rename",
            "email folders delete",
            "email drafts list",
            "email drafts show",
            "email drafts create",
            "email drafts delete",
            "email drafts send",
            "email threads list",
            "email threads show",
            "email threads search",
            "email threads delete",
            "email threads mark",
            "email scheduled list",
            "email scheduled show",
            "email scheduled cancel",
            "email attachments list",
            "email attachments show",
            "email attachments download",

            // Calendar
            "calendar list",
            "calendar show",
            "calendar create",
            "calendar update",
            "calendar delete",
            "calendar events",
            "calendar availability",
            "calendar find-time",
            "calendar recurring",
            "calendar schedule",
            "calendar virtual",
            "calendar ai",
            "calendar events list",
            "calendar events show",
            "calendar events create",
            "calendar events update",
            "calendar events delete",
            "calendar events rsvp",
            "calendar availability check",
            "calendar availability find",

            // Contacts
            "contacts list",
            "contacts show",
            "contacts search",
            "contacts create",
            "contacts update",
            "contacts delete",
            "contacts groups",
            "contacts photo",
            "contacts sync",
            "contacts groups list",
            "contacts groups show",
            "contacts groups create",
            "contacts photo info",
            "contacts photo download",

            // Inbound
            "inbound list",
            "inbound show",
            "inbound create",
            "inbound delete",
            "inbound messages",
            "inbound monitor",

            // Scheduler
            "scheduler configurations",
            "scheduler sessions",
            "scheduler bookings",
            "scheduler pages",
            "scheduler configurations list",
            "scheduler configurations show",
            "scheduler configurations create",
            "scheduler pages list",
            "scheduler pages show",
            "scheduler pages create",
            "scheduler sessions create",
            "scheduler sessions show",
            "scheduler bookings list",
            "scheduler bookings show",
            "scheduler bookings confirm",
            "scheduler bookings cancel",

            // Timezone
            "timezone list",
            "timezone info",
            "timezone convert",
            "timezone find-meeting",
            "timezone dst",

            // Webhook
            "webhook list",
            "webhook show",
            "webhook create",
            "webhook update",
            "webhook delete",
            "webhook triggers",
            "webhook test",
            "webhook server",

            // OTP
            "otp get",
            "otp watch",
            "otp list",
            "otp messages",

            // Admin
            "admin applications",
            "admin connectors",
            "admin credentials",
            "admin grants",
            "admin applications list",
            "admin applications show",
            "admin applications create",
            "admin connectors list",
            "admin connectors show",
            "admin credentials list",
            "admin credentials show",
            "admin grants list",
            "admin grants stats",

            // Notetaker
            "notetaker list",
            "notetaker show",
            "notetaker create",
            "notetaker delete",
            "notetaker media",

            // Slack
            "slack messages",
            "slack messages list",
            "slack channels",
            "slack users",

            // Other
            "version",
        };
        return table;
    }

    size_t countTokens(const std::string& entry) {
        return static_cast<size_t>(std::count(entry.begin(), entry.end(), ' ')) + 1;
    }

    bool isNormalized(const std::string& entry) {
        if (entry.empty() || entry.front() == ' ' || entry.back() == ' ') {
            return false;
        }
        if (entry.find("  ") != std::string::npos) {
            return false;
        }
        return std::none_of(entry.begin(), entry.end(), [](char c) {
            return c != ' ' && InputSanitizer::isWhitespace(c);
        });
    }

}

CommandAllowlist::CommandAllowlist(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

CommandAllowlist::CommandAllowlist(std::initializer_list<std::string> entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

const CommandAllowlist& CommandAllowlist::defaults() {
    static const CommandAllowlist instance(builtinEntries());
    return instance;
}

void CommandAllowlist::add(const std::string& entry) {
    if (!isNormalized(entry)) {
        throw std::invalid_argument("Allowlist entry is empty or not normalized: '" + entry + "'");
    }
    if (InputSanitizer::containsDangerousCharacters(entry)) {
        throw std::invalid_argument("Allowlist entry contains a shell metacharacter: '" + entry + "'");
    }

    entries_.insert(entry);
    maxDepth_ = std::max(maxDepth_, countTokens(entry));
}

bool CommandAllowlist::contains(const std::string& prefix) const {
    return entries_.find(prefix) != entries_.end();
}

std::vector<std::string> CommandAllowlist::entries() const {
    std::vector<std::string> sorted(entries_.begin(), entries_.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

} // namespace ConsoleGate
