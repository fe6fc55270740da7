#include <chrono> // std::chrono::{sys_days, year, June}

#include "GnomeMcp/Providers/PersonalData.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gtest/gtest.h"

using namespace gnome_mcp::utils::types;
using namespace gnome_mcp::providers;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  fn At(const i32 yearVal, const u32 monthVal, const u32 dayVal, const i32 hourVal = 0, const i32 minuteVal = 0) -> Timestamp {
    using namespace std::chrono;
    return sys_days { year { yearVal } / month { monthVal } / day { dayVal } } + hours { hourVal } + minutes { minuteVal };
  }

  constexpr StringView EVENT_DOCUMENT =
    "BEGIN:VCALENDAR\r\n"
    "VERSION:2.0\r\n"
    "BEGIN:VEVENT\r\n"
    "UID:evt-1@example.com\r\n"
    "SUMMARY:Team sync\\, weekly\r\n"
    "DESCRIPTION:Agenda:\\n1. Status\\n2. Plans\r\n"
    "DTSTART:20250615T090000Z\r\n"
    "DTEND;TZID=Europe/Berlin:20250615T100000\r\n"
    "LOCATION:Room 4\r\n"
    "CATEGORIES:Work,Meetings\r\n"
    "ORGANIZER;CN=\"Boss: The Big One\":mailto:boss@example.com\r\n"
    "ATTENDEE;ROLE=REQ-PARTICIPANT:MAILTO:ada@example.com\r\n"
    "ATTENDEE:mailto:charles@example.com\r\n"
    "RRULE:FREQ=WEEKLY;BYDAY=MO\r\n"
    "BEGIN:VALARM\r\n"
    "DESCRIPTION:Reminder\r\n"
    "END:VALARM\r\n"
    "END:VEVENT\r\n"
    "END:VCALENDAR\r\n";
} // namespace

TEST(ICalTest, UnfoldJoinsContinuationLines) {
  const Vec<String> lines = ical::UnfoldLines("SUMMARY:A long\r\n  summary line\r\nUID:1\r\n\r\n");

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "SUMMARY:A long summary line");
  EXPECT_EQ(lines[1], "UID:1");
}

TEST(ICalTest, ContentLineParameters) {
  const Option<ical::ContentLine> line = ical::ParseContentLine(R"(item1.EMAIL;type=INTERNET;x-label="Work: main":ada@example.com)");

  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(line->name, "EMAIL");
  EXPECT_EQ(line->value, "ada@example.com");
  EXPECT_EQ(line->params.at("TYPE"), "INTERNET");
  EXPECT_EQ(line->params.at("X-LABEL"), "Work: main");
}

TEST(ICalTest, ContentLineWithoutColonIsRejected) {
  EXPECT_FALSE(ical::ParseContentLine("NOT A CONTENT LINE").has_value());
  EXPECT_FALSE(ical::ParseContentLine(":value").has_value());
}

TEST(ICalTest, Unescape) {
  EXPECT_EQ(ical::Unescape(R"(a\,b\;c\\d\ne)"), "a,b;c\\d\ne");
  EXPECT_EQ(ical::Unescape("trailing\\"), "trailing\\");
}

TEST(ICalTest, ParseDateTimeForms) {
  EXPECT_EQ(ical::ParseDateTime("20250615"), At(2025, 6, 15));
  EXPECT_EQ(ical::ParseDateTime("20250615T093000Z"), At(2025, 6, 15, 9, 30));
  EXPECT_EQ(ical::ParseDateTime("20250615T093000"), At(2025, 6, 15, 9, 30));
  EXPECT_EQ(ical::ParseDateTime("2025-06-15"), At(2025, 6, 15));
  EXPECT_EQ(ical::ParseDateTime("20250615T113000+0200"), At(2025, 6, 15, 9, 30));
}

TEST(ICalTest, ParseDateTimeRejectsGarbage) {
  EXPECT_FALSE(ical::ParseDateTime("").has_value());
  EXPECT_FALSE(ical::ParseDateTime("tomorrow").has_value());
  EXPECT_FALSE(ical::ParseDateTime("20251301").has_value());
  EXPECT_FALSE(ical::ParseDateTime("20250615T25").has_value());
}

TEST(ICalTest, FormatTimestampIsRfc3339Utc) {
  EXPECT_EQ(ical::FormatTimestamp(At(2025, 6, 15, 9, 30)), "2025-06-15T09:30:00Z");
}

TEST(PersonalDataTest, ParseEvent) {
  Result<Event> event = ParseEvent(EVENT_DOCUMENT);

  ASSERT_TRUE(event);
  EXPECT_EQ(event->uid, "evt-1@example.com");
  EXPECT_EQ(event->summary, "Team sync, weekly");
  EXPECT_EQ(event->description, "Agenda:\n1. Status\n2. Plans");
  EXPECT_EQ(event->startTime, At(2025, 6, 15, 9));
  EXPECT_EQ(event->endTime, At(2025, 6, 15, 10));
  EXPECT_EQ(event->categories, (Vec<String> { "Work", "Meetings" }));
  EXPECT_EQ(event->organizer, "boss@example.com");
  EXPECT_EQ(event->attendees, (Vec<String> { "ada@example.com", "charles@example.com" }));
  EXPECT_EQ(event->rrule, "FREQ=WEEKLY;BYDAY=MO");
}

TEST(PersonalDataTest, ParseEventWithoutComponentFails) {
  Result<Event> event = ParseEvent("BEGIN:VCALENDAR\r\nEND:VCALENDAR\r\n");

  ASSERT_FALSE(event);
  EXPECT_EQ(event.error().code, ParseError);
}

TEST(PersonalDataTest, ParseTask) {
  Result<Task> task = ParseTask(
    "BEGIN:VCALENDAR\n"
    "BEGIN:VTODO\n"
    "UID:todo-7\n"
    "SUMMARY:File taxes\n"
    "DUE;VALUE=DATE:20250430\n"
    "STATUS:completed\n"
    "COMPLETED:20250420T120000Z\n"
    "PERCENT-COMPLETE:100\n"
    "PRIORITY:1\n"
    "END:VTODO\n"
    "END:VCALENDAR\n"
  );

  ASSERT_TRUE(task);
  EXPECT_EQ(task->uid, "todo-7");
  EXPECT_EQ(task->dueDate, At(2025, 4, 30));
  EXPECT_TRUE(task->isCompleted());
  EXPECT_FALSE(task->isCancelled());
  EXPECT_EQ(task->percentComplete, 100);
  EXPECT_EQ(task->priority, 1);
}

TEST(PersonalDataTest, ParseTaskDefaultsToNeedsAction) {
  Result<Task> task = ParseTask("BEGIN:VTODO\nUID:todo-8\nSUMMARY:Call back\nEND:VTODO\n");

  ASSERT_TRUE(task);
  EXPECT_EQ(task->status, "NEEDS-ACTION");
  EXPECT_FALSE(task->dueDate.has_value());
}

TEST(PersonalDataTest, ParseContact) {
  Result<Contact> contact = ParseContact(
    "BEGIN:VCARD\r\n"
    "VERSION:3.0\r\n"
    "UID:contact-1\r\n"
    "FN:Ada Lovelace\r\n"
    "N:Lovelace;Ada;;;\r\n"
    "EMAIL;TYPE=HOME:ada@example.com\r\n"
    "item2.EMAIL;TYPE=WORK:ada@analytical.engine\r\n"
    "TEL;TYPE=CELL:+44 20 7946 0000\r\n"
    "ADR;TYPE=HOME:;;12 St James's Square;London;;SW1Y 4JH;UK\r\n"
    "ADR:;;;;;;\r\n"
    "ORG:Analytical Engines Ltd\r\n"
    "BDAY:1815-12-10\r\n"
    "NOTE:First programmer\\, arguably\r\n"
    "END:VCARD\r\n"
  );

  ASSERT_TRUE(contact);
  EXPECT_EQ(contact->uid, "contact-1");
  EXPECT_EQ(contact->fullName, "Ada Lovelace");
  EXPECT_EQ(contact->name, "Lovelace;Ada;;;");
  EXPECT_EQ(contact->emails, (Vec<String> { "ada@example.com", "ada@analytical.engine" }));
  EXPECT_EQ(contact->phones, (Vec<String> { "+44 20 7946 0000" }));
  ASSERT_EQ(contact->addresses.size(), 1u);
  EXPECT_EQ(contact->organization, "Analytical Engines Ltd");
  EXPECT_EQ(contact->birthday, At(1815, 12, 10));
  EXPECT_EQ(contact->note, "First programmer, arguably");
}

TEST(PersonalDataTest, JsonUsesNullForMissingFields) {
  Task task;
  task.uid = "t";

  const mcp::json json = ToJson(task);

  EXPECT_TRUE(json["due_date"].is_null());
  EXPECT_EQ(json["status"], "NEEDS-ACTION");
  EXPECT_TRUE(json["categories"].is_array());
}
