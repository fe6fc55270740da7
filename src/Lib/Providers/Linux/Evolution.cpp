#include <algorithm> // std::ranges::sort
#include <sstream>   // std::istringstream

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    constexpr PCStr SOURCES_BUS    = "org.gnome.evolution.dataserver.Sources5";
    constexpr PCStr SOURCES_PATH   = "/org/gnome/evolution/dataserver/SourceManager";
    constexpr PCStr SOURCE_IFACE   = "org.gnome.evolution.dataserver.Source";
    constexpr PCStr CALENDAR_BUS   = "org.gnome.evolution.dataserver.Calendar8";
    constexpr PCStr CALENDAR_PATH  = "/org/gnome/evolution/dataserver/CalendarFactory";
    constexpr PCStr CALENDAR_IFACE = "org.gnome.evolution.dataserver.Calendar";
    constexpr PCStr BOOK_BUS       = "org.gnome.evolution.dataserver.AddressBook10";
    constexpr PCStr BOOK_PATH      = "/org/gnome/evolution/dataserver/AddressBookFactory";
    constexpr PCStr BOOK_IFACE     = "org.gnome.evolution.dataserver.AddressBook";

    struct Source {
      String     uid;
      SourceKind kind;
    };

    /// Backend object opened through one of the factories.
    struct Backend {
      String path;
      String bus;
    };

    fn FormatSexpTime(const Timestamp& stamp) -> String {
      return std::format("{:%Y%m%dT%H%M%S}Z", stamp);
    }

    class EvolutionDataProvider final : public IPersonalDataProvider {
     public:
      explicit EvolutionDataProvider(SessionPtr session) : m_session(std::move(session)) {}

      fn listEvents(const Timestamp& from, const Timestamp& to) -> Result<Vec<Event>> override {
        const String query = std::format(R"((occur-in-time-range? (make-time "{}") (make-time "{}")))", FormatSexpTime(from), FormatSexpTime(to));

        Result<Vec<String>> objects = collect(SourceKind::Calendar, query);

        if (!objects)
          return Err(objects.error());

        Vec<Event> events;

        for (const String& object : *objects) {
          Result<Event> event = ParseEvent(object);

          if (!event) {
            debug_at(event.error());
            continue;
          }

          events.push_back(std::move(*event));
        }

        std::ranges::sort(events, [](const Event& lhs, const Event& rhs) { return lhs.startTime < rhs.startTime; });

        return events;
      }

      fn listTasks() -> Result<Vec<Task>> override {
        Result<Vec<String>> objects = collect(SourceKind::TaskList, "#t");

        if (!objects)
          return Err(objects.error());

        Vec<Task> tasks;

        for (const String& object : *objects) {
          Result<Task> task = ParseTask(object);

          if (!task) {
            debug_at(task.error());
            continue;
          }

          tasks.push_back(std::move(*task));
        }

        return tasks;
      }

      fn listContacts() -> Result<Vec<Contact>> override {
        Result<Vec<String>> cards = collect(SourceKind::AddressBook, "");

        if (!cards)
          return Err(cards.error());

        Vec<Contact> contacts;

        for (const String& card : *cards) {
          Result<Contact> contact = ParseContact(card);

          if (!contact) {
            debug_at(contact.error());
            continue;
          }

          contacts.push_back(std::move(*contact));
        }

        return contacts;
      }

     private:
      SessionPtr m_session;

      /// Every object of the given kind across all enabled sources.
      /// A source that fails to open is logged and skipped.
      fn collect(const SourceKind kind, const String& query) -> Result<Vec<String>> {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<Vec<Source>> sources = listSources(connection);

        if (!sources)
          return Err(sources.error());

        Vec<String> out;

        for (const Source& source : *sources) {
          if (source.kind != kind)
            continue;

          Result<Vec<String>> objects = kind == SourceKind::AddressBook ? readBook(connection, source.uid, query) : readCalendar(connection, source, query);

          if (!objects) {
            warn_log("Skipping source {}: {}", source.uid, objects.error().message);
            continue;
          }

          out.insert(out.end(), std::make_move_iterator(objects->begin()), std::make_move_iterator(objects->end()));
        }

        return out;
      }

      fn listSources(const DBus::Connection& connection) const -> Result<Vec<Source>> {
        Result<DBus::Message> reply =
          connection.call(SOURCES_BUS, SOURCES_PATH, "org.freedesktop.DBus.ObjectManager", "GetManagedObjects", m_session->timeoutMs());

        if (!reply) {
          if (reply.error().code == NotFound)
            ERR_FMT(ApiUnavailable, "Evolution Data Server is not running: {}", reply.error().message);

          return Err(reply.error());
        }

        DBus::MessageIter iter = reply->iterInit();

        if (!iter.isValid() || iter.getArgType() != DBUS_TYPE_ARRAY)
          ERR(ParseError, "Invalid GetManagedObjects reply format: Expected array");

        Vec<Source> sources;

        // a{oa{sa{sv}}}: object -> interface -> property -> value
        iter.forEachEntry([&sources](const String&, DBus::MessageIter& interfaces) {
          interfaces.forEachEntry([&sources](const String& interface, DBus::MessageIter& properties) {
            if (interface != SOURCE_IFACE)
              return;

            Option<String> uid;
            Option<String> data;

            properties.forEachEntry([&uid, &data](const String& name, DBus::MessageIter& value) {
              if (name == "UID")
                uid = value.getString();
              else if (name == "Data")
                data = value.getString();
            });

            if (!uid || !data)
              return;

            if (Option<SourceKind> kind = ParseSourceData(*data))
              sources.push_back({ .uid = *uid, .kind = *kind });
          });
        });

        debug_log("Found {} enabled Evolution sources", sources.size());

        return sources;
      }

      fn openBackend(const DBus::Connection& connection, PCStr bus, PCStr path, PCStr interface, PCStr method, const String& uid) const
        -> Result<Backend> {
        Result<DBus::Message> reply = connection.call(bus, path, interface, method, m_session->timeoutMs(), uid);

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        Option<String> objectPath = iter.getString();
        Option<String> busName    = iter.next() ? iter.getString() : None;

        if (!objectPath || !busName)
          ERR_FMT(ParseError, "Unexpected {} reply", method);

        return Backend { .path = *objectPath, .bus = *busName };
      }

      fn readCalendar(const DBus::Connection& connection, const Source& source, const String& query) const -> Result<Vec<String>> {
        Result<Backend> backend = openBackend(
          connection,
          CALENDAR_BUS,
          CALENDAR_PATH,
          "org.gnome.evolution.dataserver.CalendarFactory",
          source.kind == SourceKind::TaskList ? "OpenTaskList" : "OpenCalendar",
          source.uid
        );

        if (!backend)
          return Err(backend.error());

        return readObjects(connection, *backend, CALENDAR_IFACE, "GetObjectList", query);
      }

      fn readBook(const DBus::Connection& connection, const String& uid, const String& query) const -> Result<Vec<String>> {
        Result<Backend> backend =
          openBackend(connection, BOOK_BUS, BOOK_PATH, "org.gnome.evolution.dataserver.AddressBookFactory", "OpenAddressBook", uid);

        if (!backend)
          return Err(backend.error());

        return readObjects(connection, *backend, BOOK_IFACE, "GetContactList", query);
      }

      /// Opens the backend, runs the listing method, and closes it again.
      fn readObjects(const DBus::Connection& connection, const Backend& backend, PCStr interface, PCStr method, const String& query) const
        -> Result<Vec<String>> {
        if (Result<DBus::Message> opened = connection.call(backend.bus.c_str(), backend.path.c_str(), interface, "Open", m_session->timeoutMs()); !opened)
          return Err(opened.error());

        Result<DBus::Message> reply = connection.call(backend.bus.c_str(), backend.path.c_str(), interface, method, m_session->timeoutMs(), query);

        if (Result<DBus::Message> closed = connection.call(backend.bus.c_str(), backend.path.c_str(), interface, "Close", m_session->timeoutMs()); !closed)
          debug_at(closed.error());

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        return iter.getStringList();
      }
    };
  } // namespace

  fn ParseSourceData(const StringView data) -> Option<SourceKind> {
    std::istringstream stream { String(data) };

    String             group;
    bool               enabled = true;
    Option<SourceKind> kind;

    for (String line; std::getline(stream, line);) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();

      if (line.empty() || line.front() == '#')
        continue;

      if (line.front() == '[' && line.back() == ']') {
        group = line.substr(1, line.size() - 2);

        if (group == "Calendar")
          kind = SourceKind::Calendar;
        else if (group == "Task List")
          kind = SourceKind::TaskList;
        else if (group == "Address Book")
          kind = SourceKind::AddressBook;

        continue;
      }

      if (group != "Data Source")
        continue;

      if (const usize equals = line.find('='); equals != String::npos && Trim(line.substr(0, equals)) == "Enabled")
        enabled = Trim(line.substr(equals + 1)) != "false";
    }

    return enabled ? kind : None;
  }

  fn MakePersonalDataProvider(SessionPtr session) -> SharedPointer<IPersonalDataProvider> {
    return std::make_shared<EvolutionDataProvider>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
