#pragma once

#include <chrono>        // std::chrono::sys_seconds
#include <mcp_message.h> // mcp::json

#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

namespace gnome_mcp::providers {
  namespace {
    using utils::types::i64;
    using utils::types::Map;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  using Timestamp = std::chrono::sys_seconds;

  /**
   * @struct Event
   * @brief A calendar event (VEVENT).
   */
  struct Event {
    Option<String>    summary;
    Option<String>    description;
    Option<Timestamp> startTime;
    Option<Timestamp> endTime;
    String            uid;
    Option<String>    location;
    Vec<String>       categories;
    Option<i64>       priority;
    Option<String>    organizer;
    Vec<String>       attendees;
    Option<String>    status;
    Option<String>    transparency; ///< OPAQUE/TRANSPARENT
    Option<String>    classification; ///< PUBLIC/PRIVATE/CONFIDENTIAL
    Option<Timestamp> created;
    Option<Timestamp> lastModified;
    Option<String>    url;
    Option<String>    rrule;
  };

  /**
   * @struct Task
   * @brief A to-do item (VTODO).
   */
  struct Task {
    Option<String>    summary;
    Option<String>    description;
    Option<Timestamp> dueDate;
    Option<Timestamp> completedDate;
    String            status = "NEEDS-ACTION";
    String            uid;
    Option<Timestamp> startDate;
    Option<i64>       priority;
    Vec<String>       categories;
    Option<i64>       percentComplete;
    Option<Timestamp> created;
    Option<Timestamp> lastModified;
    Option<String>    location;
    Option<String>    url;
    Option<String>    classification;

    [[nodiscard]] fn isCompleted() const -> bool {
      return status == "COMPLETED";
    }

    [[nodiscard]] fn isCancelled() const -> bool {
      return status == "CANCELLED";
    }
  };

  /**
   * @struct Contact
   * @brief An address book entry (vCard).
   *
   * Structured properties (N, ADR, ORG) keep their `;`-separated components.
   */
  struct Contact {
    Option<String>    fullName;
    Option<String>    name;
    Option<String>    nickname;
    Vec<String>       emails;
    Vec<String>       phones;
    Vec<String>       impp;
    Vec<String>       addresses;
    Option<Timestamp> birthday;
    Option<Timestamp> anniversary;
    Option<String>    organization;
    Option<String>    title;
    Option<String>    role;
    Vec<String>       urls;
    Vec<String>       categories;
    Vec<String>       related;
    Option<String>    gender;
    Option<String>    language;
    Option<String>    timezone;
    Option<String>    geo;
    Option<String>    note;
    String            uid;
  };

  namespace ical {
    /**
     * @struct ContentLine
     * @brief One unfolded `NAME;PARAM=VALUE:value` line of an iCalendar or vCard document.
     */
    struct ContentLine {
      String              name;   ///< Upper-cased, without any vCard group prefix.
      Map<String, String> params; ///< Upper-cased parameter names.
      String              value;  ///< Raw value, still escaped.
    };

    /**
     * @brief Splits a document into logical lines, joining folded continuations.
     */
    fn UnfoldLines(StringView text) -> Vec<String>;

    fn ParseContentLine(StringView line) -> Option<ContentLine>;

    /**
     * @brief Resolves `\\n`, `\\,`, `\\;` and `\\\\` escapes.
     */
    fn Unescape(StringView value) -> String;

    /**
     * @brief Parses `YYYYMMDD`, `YYYYMMDDTHHMMSS[Z]` and the dashed ISO forms.
     *
     * Floating and TZID-qualified times are read as UTC.
     */
    fn ParseDateTime(StringView value) -> Option<Timestamp>;

    /// Formats a timestamp as RFC 3339 in UTC.
    fn FormatTimestamp(const Timestamp& stamp) -> String;
  } // namespace ical

  /**
   * @brief Parses the first VEVENT of an iCalendar object.
   */
  fn ParseEvent(StringView document) -> Result<Event>;

  /**
   * @brief Parses the first VTODO of an iCalendar object.
   */
  fn ParseTask(StringView document) -> Result<Task>;

  /**
   * @brief Parses a single vCard.
   */
  fn ParseContact(StringView document) -> Result<Contact>;

  fn ToJson(const Event& event) -> mcp::json;
  fn ToJson(const Task& task) -> mcp::json;
  fn ToJson(const Contact& contact) -> mcp::json;
} // namespace gnome_mcp::providers
