#include "GnomeMcp/Providers/PersonalData.hpp"

#include <algorithm> // std::ranges::{all_of, transform}
#include <cctype>    // std::{isdigit, toupper, tolower}
#include <format>    // std::format

using namespace gnome_mcp::utils::types;
using gnome_mcp::providers::Timestamp;
using gnome_mcp::providers::ical::ContentLine;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace {
  using namespace gnome_mcp::providers::ical;

  fn ToUpper(String text) -> String {
    std::ranges::transform(text, text.begin(), [](const char chr) { return static_cast<char>(std::toupper(static_cast<unsigned char>(chr))); });
    return text;
  }

  fn Digits(const StringView text, const usize pos, const usize len) -> Option<i32> {
    if (pos + len > text.size())
      return None;

    i32 value = 0;

    for (usize i = pos; i < pos + len; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(text[i])))
        return None;

      value = (value * 10) + (text[i] - '0');
    }

    return value;
  }

  /**
   * @brief Content lines of the first `component` block, excluding nested blocks.
   */
  fn ComponentLines(const StringView document, const StringView component) -> Result<Vec<ContentLine>> {
    Vec<ContentLine> lines;
    bool             inside = false;
    i32              depth  = 0;

    for (const String& raw : UnfoldLines(document)) {
      Option<ContentLine> line = ParseContentLine(raw);

      if (!line)
        continue;

      if (line->name == "BEGIN") {
        if (!inside && ToUpper(line->value) == component)
          inside = true;
        else if (inside)
          ++depth;

        continue;
      }

      if (line->name == "END" && inside) {
        if (depth == 0)
          return lines;

        --depth;
        continue;
      }

      if (inside && depth == 0)
        lines.push_back(std::move(*line));
    }

    if (!inside)
      ERR_FMT(ParseError, "No {} component found", component);

    // Unterminated block: keep what was read.
    return lines;
  }

  fn Find(const Vec<ContentLine>& lines, const StringView name) -> const ContentLine* {
    for (const ContentLine& line : lines)
      if (line.name == name)
        return &line;

    return nullptr;
  }

  fn Text(const Vec<ContentLine>& lines, const StringView name) -> Option<String> {
    if (const ContentLine* line = Find(lines, name)) {
      String value = Unescape(line->value);

      if (!value.empty())
        return value;
    }

    return None;
  }

  /// Structured values (N, ADR, ORG) whose components are all empty count as absent.
  fn Structured(const StringView value) -> Option<String> {
    String text = Unescape(value);

    if (std::ranges::all_of(text, [](const char chr) { return chr == ';'; }))
      return None;

    return text;
  }

  fn AllText(const Vec<ContentLine>& lines, const StringView name) -> Vec<String> {
    Vec<String> values;

    for (const ContentLine& line : lines)
      if (line.name == name)
        if (String value = Unescape(line.value); !value.empty())
          values.push_back(std::move(value));

    return values;
  }

  /// Splits comma-separated list values (CATEGORIES) on unescaped commas.
  fn ListValues(const Vec<ContentLine>& lines, const StringView name) -> Vec<String> {
    Vec<String> values;

    for (const ContentLine& line : lines) {
      if (line.name != name)
        continue;

      String current;

      for (usize i = 0; i < line.value.size(); ++i) {
        if (line.value[i] == '\\' && i + 1 < line.value.size()) {
          current += line.value[i];
          current += line.value[++i];
        } else if (line.value[i] == ',') {
          if (String item = Unescape(current); !item.empty())
            values.push_back(std::move(item));
          current.clear();
        } else {
          current += line.value[i];
        }
      }

      if (String item = Unescape(current); !item.empty())
        values.push_back(std::move(item));
    }

    return values;
  }

  fn Time(const Vec<ContentLine>& lines, const StringView name) -> Option<Timestamp> {
    if (const ContentLine* line = Find(lines, name))
      return ParseDateTime(line->value);

    return None;
  }

  fn Integer(const Vec<ContentLine>& lines, const StringView name) -> Option<i64> {
    const ContentLine* line = Find(lines, name);

    if (!line || line->value.empty() || line->value.size() > 9)
      return None;

    if (Option<i32> value = Digits(line->value, 0, line->value.size()))
      return *value;

    return None;
  }

  fn CalAddress(String value) -> String {
    if (value.size() >= 7 && ToUpper(value.substr(0, 7)) == "MAILTO:")
      return value.substr(7);

    return value;
  }

  fn OptionalJson(const Option<String>& value) -> mcp::json {
    return value ? mcp::json(*value) : mcp::json(nullptr);
  }

  fn OptionalJson(const Option<i64>& value) -> mcp::json {
    return value ? mcp::json(*value) : mcp::json(nullptr);
  }

  fn OptionalJson(const Option<Timestamp>& value) -> mcp::json {
    return value ? mcp::json(FormatTimestamp(*value)) : mcp::json(nullptr);
  }
} // namespace

namespace gnome_mcp::providers {
  namespace ical {
    fn UnfoldLines(const StringView text) -> Vec<String> {
      Vec<String> lines;
      usize       start = 0;

      while (start < text.size()) {
        usize end = text.find('\n', start);

        if (end == StringView::npos)
          end = text.size();

        StringView line = text.substr(start, end - start);

        if (!line.empty() && line.back() == '\r')
          line.remove_suffix(1);

        if (!line.empty() && (line.front() == ' ' || line.front() == '\t') && !lines.empty())
          lines.back() += line.substr(1);
        else if (!line.empty())
          lines.emplace_back(line);

        start = end + 1;
      }

      return lines;
    }

    fn ParseContentLine(const StringView line) -> Option<ContentLine> {
      bool  quoted = false;
      usize colon  = StringView::npos;

      for (usize i = 0; i < line.size(); ++i) {
        if (line[i] == '"')
          quoted = !quoted;
        else if (line[i] == ':' && !quoted) {
          colon = i;
          break;
        }
      }

      if (colon == StringView::npos || colon == 0)
        return None;

      const StringView head = line.substr(0, colon);

      Vec<String> parts;
      String      current;
      quoted = false;

      for (const char chr : head) {
        if (chr == '"')
          quoted = !quoted;

        if (chr == ';' && !quoted) {
          parts.push_back(std::move(current));
          current.clear();
        } else {
          current += chr;
        }
      }

      parts.push_back(std::move(current));

      ContentLine result;

      String name = parts.front();

      if (const usize dot = name.rfind('.'); dot != String::npos)
        name = name.substr(dot + 1);

      result.name  = ToUpper(std::move(name));
      result.value = String(line.substr(colon + 1));

      for (usize i = 1; i < parts.size(); ++i) {
        const usize equals = parts[i].find('=');

        if (equals == String::npos)
          continue;

        String value = parts[i].substr(equals + 1);

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
          value = value.substr(1, value.size() - 2);

        result.params.emplace(ToUpper(parts[i].substr(0, equals)), std::move(value));
      }

      return result;
    }

    fn Unescape(const StringView value) -> String {
      String out;
      out.reserve(value.size());

      for (usize i = 0; i < value.size(); ++i) {
        if (value[i] != '\\' || i + 1 == value.size()) {
          out += value[i];
          continue;
        }

        const char next = value[++i];

        if (next == 'n' || next == 'N')
          out += '\n';
        else
          out += next;
      }

      return out;
    }

    fn ParseDateTime(const StringView value) -> Option<Timestamp> {
      using namespace std::chrono;

      String compact;

      for (const char chr : value)
        if (chr != '-' && chr != ':')
          compact += chr;

      const Option<i32> yearVal  = Digits(compact, 0, 4);
      const Option<i32> monthVal = Digits(compact, 4, 2);
      const Option<i32> dayVal   = Digits(compact, 6, 2);

      if (!yearVal || !monthVal || !dayVal)
        return None;

      const year_month_day date { year { *yearVal }, month { static_cast<unsigned>(*monthVal) }, day { static_cast<unsigned>(*dayVal) } };

      if (!date.ok())
        return None;

      Timestamp stamp { sys_days { date } };

      if (compact.size() == 8)
        return stamp;

      if (compact.size() < 15 || compact[8] != 'T')
        return None;

      const Option<i32> hourVal   = Digits(compact, 9, 2);
      const Option<i32> minuteVal = Digits(compact, 11, 2);
      const Option<i32> secondVal = Digits(compact, 13, 2);

      if (!hourVal || !minuteVal || !secondVal || *hourVal > 23 || *minuteVal > 59 || *secondVal > 60)
        return None;

      stamp += hours { *hourVal } + minutes { *minuteVal } + seconds { *secondVal };

      const StringView suffix = StringView(compact).substr(15);

      if (suffix.empty() || suffix == "Z")
        return stamp;

      // UTC offset, e.g. +0200
      if ((suffix.front() == '+' || suffix.front() == '-') && suffix.size() == 5) {
        const Option<i32> offH = Digits(suffix, 1, 2);
        const Option<i32> offM = Digits(suffix, 3, 2);

        if (!offH || !offM)
          return None;

        const seconds offset = hours { *offH } + minutes { *offM };
        return suffix.front() == '+' ? stamp - offset : stamp + offset;
      }

      return None;
    }

    fn FormatTimestamp(const Timestamp& stamp) -> String {
      return std::format("{:%Y-%m-%dT%H:%M:%SZ}", stamp);
    }
  } // namespace ical

  fn ParseEvent(const StringView document) -> Result<Event> {
    Result<Vec<ContentLine>> lines = ComponentLines(document, "VEVENT");

    if (!lines)
      return Err(lines.error());

    Event event;
    event.summary        = Text(*lines, "SUMMARY");
    event.description    = Text(*lines, "DESCRIPTION");
    event.startTime      = Time(*lines, "DTSTART");
    event.endTime        = Time(*lines, "DTEND");
    event.uid            = Text(*lines, "UID").value_or("");
    event.location       = Text(*lines, "LOCATION");
    event.categories     = ListValues(*lines, "CATEGORIES");
    event.priority       = Integer(*lines, "PRIORITY");
    event.status         = Text(*lines, "STATUS");
    event.transparency   = Text(*lines, "TRANSP");
    event.classification = Text(*lines, "CLASS");
    event.created        = Time(*lines, "CREATED");
    event.lastModified   = Time(*lines, "LAST-MODIFIED");
    event.url            = Text(*lines, "URL");
    event.rrule          = Text(*lines, "RRULE");

    if (Option<String> organizer = Text(*lines, "ORGANIZER"))
      event.organizer = CalAddress(std::move(*organizer));

    for (String& attendee : AllText(*lines, "ATTENDEE"))
      event.attendees.push_back(CalAddress(std::move(attendee)));

    return event;
  }

  fn ParseTask(const StringView document) -> Result<Task> {
    Result<Vec<ContentLine>> lines = ComponentLines(document, "VTODO");

    if (!lines)
      return Err(lines.error());

    Task task;
    task.summary         = Text(*lines, "SUMMARY");
    task.description     = Text(*lines, "DESCRIPTION");
    task.dueDate         = Time(*lines, "DUE");
    task.completedDate   = Time(*lines, "COMPLETED");
    task.uid             = Text(*lines, "UID").value_or("");
    task.startDate       = Time(*lines, "DTSTART");
    task.priority        = Integer(*lines, "PRIORITY");
    task.categories      = ListValues(*lines, "CATEGORIES");
    task.percentComplete = Integer(*lines, "PERCENT-COMPLETE");
    task.created         = Time(*lines, "CREATED");
    task.lastModified    = Time(*lines, "LAST-MODIFIED");
    task.location        = Text(*lines, "LOCATION");
    task.url             = Text(*lines, "URL");
    task.classification  = Text(*lines, "CLASS");

    if (Option<String> status = Text(*lines, "STATUS"))
      task.status = ToUpper(std::move(*status));

    return task;
  }

  fn ParseContact(const StringView document) -> Result<Contact> {
    Result<Vec<ContentLine>> lines = ComponentLines(document, "VCARD");

    if (!lines)
      return Err(lines.error());

    Contact contact;
    contact.fullName    = Text(*lines, "FN");
    contact.nickname    = Text(*lines, "NICKNAME");
    contact.emails      = AllText(*lines, "EMAIL");
    contact.phones      = AllText(*lines, "TEL");
    contact.impp        = AllText(*lines, "IMPP");
    contact.birthday    = Time(*lines, "BDAY");
    contact.anniversary = Time(*lines, "ANNIVERSARY");
    contact.title       = Text(*lines, "TITLE");
    contact.role        = Text(*lines, "ROLE");
    contact.urls        = AllText(*lines, "URL");
    contact.categories  = ListValues(*lines, "CATEGORIES");
    contact.related     = AllText(*lines, "RELATED");
    contact.gender      = Text(*lines, "GENDER");
    contact.language    = Text(*lines, "LANG");
    contact.timezone    = Text(*lines, "TZ");
    contact.geo         = Text(*lines, "GEO");
    contact.note        = Text(*lines, "NOTE");
    contact.uid         = Text(*lines, "UID").value_or("");

    if (const ContentLine* line = Find(*lines, "N"))
      contact.name = Structured(line->value);

    if (const ContentLine* line = Find(*lines, "ORG"))
      contact.organization = Structured(line->value);

    for (const ContentLine& line : *lines)
      if (line.name == "ADR")
        if (Option<String> address = Structured(line.value))
          contact.addresses.push_back(std::move(*address));

    return contact;
  }

  fn ToJson(const Event& event) -> mcp::json {
    return {
      {       "summary", OptionalJson(event.summary) },
      {   "description", OptionalJson(event.description) },
      {    "start_time", OptionalJson(event.startTime) },
      {      "end_time", OptionalJson(event.endTime) },
      {           "uid", event.uid },
      {      "location", OptionalJson(event.location) },
      {    "categories", event.categories },
      {      "priority", OptionalJson(event.priority) },
      {     "organizer", OptionalJson(event.organizer) },
      {     "attendees", event.attendees },
      {        "status", OptionalJson(event.status) },
      {  "transparency", OptionalJson(event.transparency) },
      {         "class", OptionalJson(event.classification) },
      {       "created", OptionalJson(event.created) },
      { "last_modified", OptionalJson(event.lastModified) },
      {           "url", OptionalJson(event.url) },
      {         "rrule", OptionalJson(event.rrule) },
    };
  }

  fn ToJson(const Task& task) -> mcp::json {
    return {
      {          "summary", OptionalJson(task.summary) },
      {      "description", OptionalJson(task.description) },
      {         "due_date", OptionalJson(task.dueDate) },
      {   "completed_date", OptionalJson(task.completedDate) },
      {           "status", task.status },
      {              "uid", task.uid },
      {       "start_date", OptionalJson(task.startDate) },
      {         "priority", OptionalJson(task.priority) },
      {       "categories", task.categories },
      { "percent_complete", OptionalJson(task.percentComplete) },
      {          "created", OptionalJson(task.created) },
      {    "last_modified", OptionalJson(task.lastModified) },
      {         "location", OptionalJson(task.location) },
      {              "url", OptionalJson(task.url) },
      {            "class", OptionalJson(task.classification) },
    };
  }

  fn ToJson(const Contact& contact) -> mcp::json {
    return {
      {    "full_name", OptionalJson(contact.fullName) },
      {         "name", OptionalJson(contact.name) },
      {     "nickname", OptionalJson(contact.nickname) },
      {       "emails", contact.emails },
      {       "phones", contact.phones },
      {         "impp", contact.impp },
      {    "addresses", contact.addresses },
      {     "birthday", OptionalJson(contact.birthday) },
      {  "anniversary", OptionalJson(contact.anniversary) },
      { "organization", OptionalJson(contact.organization) },
      {        "title", OptionalJson(contact.title) },
      {         "role", OptionalJson(contact.role) },
      {         "urls", contact.urls },
      {   "categories", contact.categories },
      {      "related", contact.related },
      {       "gender", OptionalJson(contact.gender) },
      {     "language", OptionalJson(contact.language) },
      {     "timezone", OptionalJson(contact.timezone) },
      {          "geo", OptionalJson(contact.geo) },
      {         "note", OptionalJson(contact.note) },
      {          "uid", contact.uid },
    };
  }
} // namespace gnome_mcp::providers
