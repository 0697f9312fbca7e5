#include "CommandRunner.h"
#include "CommandClassifier.h"
#include "InputSanitizer.h"
#include "LoggerMacros.h"

#include <unordered_map>

namespace ConsoleGate {

namespace {

    const std::unordered_map<std::string, std::string>& cannedTable() {
        static const std::unordered_map<std::string, std::string> table = {
            {"email list",
             "Demo Mode - Sample Emails\n"
             "\n"
             "  * o  alice@example.com       Weekly Team Sync - Agenda        2 min ago\n"
             "    o  bob@work.com            Project Update: Q4 Goals         15 min ago\n"
             "  *    calendar@example.com    Reminder: Design Review          1 hour ago\n"
             "    o  notifications@example   New PR opened                    2 hours ago\n"
             "       support@example.com     Welcome!                         1 day ago\n"
             "\n"
             "Showing 5 of 127 messages"},
            {"email threads",
             "Demo Mode - Sample Threads\n"
             "\n"
             "  * o  Team Weekly Standup     5 messages    alice, bob, carol    2 min ago\n"
             "    o  Project Planning Q1     12 messages   team@company.org     1 hour ago\n"
             "  *    Design Review           3 messages    design@example.com   3 hours ago\n"
             "       Onboarding Docs         2 messages    hr@company.org       1 day ago\n"
             "\n"
             "Showing 4 threads"},
            {"calendar list",
             "Demo Mode - Sample Calendars\n"
             "\n"
             "  ID                     NAME                 PRIMARY\n"
             "  cal-primary-001        Work Calendar        yes\n"
             "  cal-personal-002       Personal\n"
             "  cal-team-003           Team Events\n"
             "\n"
             "3 calendars found"},
            {"calendar events",
             "Demo Mode - Sample Events\n"
             "\n"
             "  TODAY\n"
             "  09:00 - 10:00   Team Standup                  Conference Room A\n"
             "  14:00 - 15:00   Design Review                 Video Call\n"
             "\n"
             "  TOMORROW\n"
             "  10:00 - 11:00   1:1 with Manager              Office\n"
             "  15:00 - 16:00   Sprint Planning               Conference Room B\n"
             "\n"
             "4 upcoming events"},
            {"auth status",
             "Demo Mode - Authentication Status\n"
             "\n"
             "  Status:     Configured\n"
             "  Region:     US\n"
             "  Client ID:  demo-client-id\n"
             "  API Key:    ********configured\n"
             "\n"
             "  Default Account: alice@example.com (Google)"},
            {"auth list",
             "Demo Mode - Connected Accounts\n"
             "\n"
             "  *  alice@example.com    Google      demo-grant-001 (default)\n"
             "     bob@work.com         Microsoft   demo-grant-002\n"
             "     carol@company.org    Google      demo-grant-003\n"
             "\n"
             "3 accounts connected"},
            {"contacts list",
             "Demo Mode - Sample Contacts\n"
             "\n"
             "  NAME                   EMAIL                      PHONE\n"
             "  Alice Johnson          alice@example.com          +1-555-0101\n"
             "  Bob Smith              bob@work.com               +1-555-0102\n"
             "  Carol Williams         carol@company.org          +1-555-0103\n"
             "\n"
             "Showing 3 of 127 contacts"},
            {"contacts groups",
             "Demo Mode - Contact Groups\n"
             "\n"
             "  ID                     NAME                 MEMBERS\n"
             "  grp-001                Work                 23\n"
             "  grp-002                Personal             15\n"
             "  grp-003                VIP Clients          8\n"
             "\n"
             "3 groups found"},
            {"inbound list",
             "Demo Mode - Inbound Inboxes\n"
             "\n"
             "  ID                     ADDRESS                           STATUS\n"
             "  inbox-001              support@yourapp.example           Active\n"
             "  inbox-002              leads@yourapp.example             Active\n"
             "\n"
             "2 inbound inboxes"},
            {"scheduler configurations",
             "Demo Mode - Scheduler Configurations\n"
             "\n"
             "  ID                     NAME                 DURATION    AVAILABILITY\n"
             "  cfg-001                30-min Meeting       30 min      Mon-Fri 9-5\n"
             "  cfg-002                1-hour Consultation  60 min      Mon-Wed 10-4\n"
             "\n"
             "2 configurations"},
            {"timezone list",
             "Demo Mode - Time Zones\n"
             "\n"
             "  REGION          ZONE                    OFFSET\n"
             "  America         America/New_York        -05:00\n"
             "  Europe          Europe/London           +00:00\n"
             "  Asia            Asia/Tokyo              +09:00\n"
             "\n"
             "Showing 3 of 594 time zones"},
            {"webhook list",
             "Demo Mode - Webhooks\n"
             "\n"
             "  ID        CALLBACK URL                           TRIGGERS        STATUS\n"
             "  wh-001    https://example.com/webhook/events     message.*       Active\n"
             "  wh-002    https://hooks.example.com/contacts     contact.*       Paused\n"
             "\n"
             "2 webhooks configured"},
            {"otp list",
             "Demo Mode - Configured OTP Accounts\n"
             "\n"
             "  EMAIL                      DEFAULT    LAST OTP\n"
             "  alice@example.com          yes        2 min ago\n"
             "  bob@work.com                          1 hour ago\n"
             "\n"
             "2 accounts configured"},
            {"admin grants",
             "Demo Mode - Grants\n"
             "\n"
             "  ID           EMAIL                      PROVIDER       STATUS\n"
             "  grant-001    alice@example.com          Google         Active\n"
             "  grant-002    bob@work.com               Microsoft      Active\n"
             "\n"
             "2 grants"},
            {"notetaker list",
             "Demo Mode - Notetakers\n"
             "\n"
             "  ID        MEETING                 STATUS        CREATED\n"
             "  nt-001    Team Standup            Completed     Dec 24\n"
             "  nt-002    Sprint Planning         Scheduled     Dec 27\n"
             "\n"
             "2 notetakers"},
        };
        return table;
    }

}

std::string DemoCommandRunner::cannedOutput(const std::string& command) {
    std::string cmd = InputSanitizer::trim(command);
    auto tokens = CommandClassifier::tokenize(cmd);
    if (tokens.empty()) {
        return "Demo mode - no command specified";
    }

    if (tokens[0] == "version") {
        return "consolegate version dev (demo mode)";
    }

    std::string key = CommandClassifier::joinTokens(tokens, tokens.size() >= 2 ? 2 : 1);
    const auto& table = cannedTable();
    auto it = table.find(key);
    if (it != table.end()) {
        return it->second;
    }
    return "Demo Mode - Command: " + cmd +
           "\n\n(This is sample output. Connect an account to see real data.)";
}

CommandResponse DemoCommandRunner::run(const std::string& command,
                                       const SubprocessExecutor::CancelCheck& /*cancelled*/) {
    LOG_DEBUG_COMP_IF("Demo output for '" + command + "'", "Demo");
    return CommandResponse::withOutput(cannedOutput(command));
}

} // namespace ConsoleGate
