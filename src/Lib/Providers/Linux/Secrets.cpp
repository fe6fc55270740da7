#include <tuple> // std::tuple

#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::providers::gnome {
  namespace {
    constexpr PCStr SECRETS_BUS     = "org.freedesktop.secrets";
    constexpr PCStr SECRETS_PATH    = "/org/freedesktop/secrets";
    constexpr PCStr SERVICE_IFACE   = "org.freedesktop.Secret.Service";
    constexpr PCStr ITEM_IFACE      = "org.freedesktop.Secret.Item";
    constexpr PCStr PROMPT_IFACE    = "org.freedesktop.Secret.Prompt";
    constexpr PCStr DEFAULT_ALIAS   = "/org/freedesktop/secrets/aliases/default";
    constexpr PCStr NO_PROMPT       = "/";
    constexpr PCStr TEXT_PLAIN      = "text/plain";

    /// (session, parameters, value, content type) as sent to CreateItem.
    using SecretStruct = std::tuple<DBus::ObjectPath, DBus::ByteArray, DBus::ByteArray, String>;

    class SecretServiceStore final : public ISecretStore {
     public:
      explicit SecretServiceStore(SessionPtr session) : m_session(std::move(session)) {}

      fn store(const String& label, const String& secret, const SecretAttributes& attributes) -> Result<String> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<String> session = openSession(connection);

        if (!session)
          return Err(session.error());

        Result<String> collection = defaultCollection(connection);

        if (!collection)
          return Err(collection.error());

        if (Result<> unlocked = unlock(connection, { DBus::ObjectPath { *collection } }); !unlocked)
          return Err(unlocked.error());

        Result<DBus::Message> reply = connection.call(
          SECRETS_BUS,
          collection->c_str(),
          "org.freedesktop.Secret.Collection",
          "CreateItem",
          m_session->timeoutMs(),
          DBus::VariantDict {
            {      "org.freedesktop.Secret.Item.Label", label },
            { "org.freedesktop.Secret.Item.Attributes", DBus::StringDict(attributes.begin(), attributes.end()) },
          },
          SecretStruct { DBus::ObjectPath { *session }, {}, DBus::ByteArray(secret.begin(), secret.end()), TEXT_PLAIN },
          true
        );

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        Option<String> item = iter.getString();

        if (iter.next())
          if (Option<String> prompt = iter.getString(); prompt && *prompt != NO_PROMPT) {
            Result<DBus::Message> completed = runPrompt(connection, *prompt);

            if (!completed)
              return Err(completed.error());

            // The created item path is the result of the prompt.
            DBus::MessageIter result = completed->iterInit();

            if (result.next())
              item = result.getString();
          }

        if (!item || *item == NO_PROMPT)
          ERR(ParseError, "CreateItem returned no item");

        info_log("Stored secret '{}'", label);

        return *item;
      }

      fn retrieve(const SecretAttributes& attributes) -> Result<SecretItem> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<String> path = findItem(connection, attributes);

        if (!path)
          return Err(path.error());

        Result<String> session = openSession(connection);

        if (!session)
          return Err(session.error());

        Result<DBus::Message> reply = connection.call(SECRETS_BUS, path->c_str(), ITEM_IFACE, "GetSecret", m_session->timeoutMs(), DBus::ObjectPath { *session });

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter   = reply->iterInit();
        DBus::MessageIter fields = iter.recurse();

        // (o session, ay parameters, ay value, s content_type)
        if (!fields.isValid() || !fields.next() || !fields.next())
          ERR(ParseError, "Malformed secret returned by the Secret Service");

        const DBus::ByteArray value = fields.getBytes();

        SecretItem item {
          .path       = *path,
          .label      = label(connection, *path),
          .secret     = String(value.begin(), value.end()),
          .attributes = itemAttributes(connection, *path),
        };

        return item;
      }

      fn remove(const SecretAttributes& attributes) -> Result<String> override {
        LockGuard lock(m_session->mutex());

        Result<const DBus::Connection*> bus = m_session->sessionBus();

        if (!bus)
          return Err(bus.error());

        const DBus::Connection& connection = **bus;

        Result<String> path = findItem(connection, attributes);

        if (!path)
          return Err(path.error());

        const String itemLabel = label(connection, *path);

        Result<DBus::Message> reply = connection.call(SECRETS_BUS, path->c_str(), ITEM_IFACE, "Delete", m_session->timeoutMs());

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        if (Option<String> prompt = iter.getString(); prompt && *prompt != NO_PROMPT)
          if (Result<DBus::Message> completed = runPrompt(connection, *prompt); !completed)
            return Err(completed.error());

        info_log("Deleted secret '{}'", itemLabel);

        return itemLabel;
      }

     private:
      SessionPtr m_session;

      fn openSession(const DBus::Connection& connection) const -> Result<String> {
        Result<DBus::Message> reply = connection.call(
          SECRETS_BUS, SECRETS_PATH, SERVICE_IFACE, "OpenSession", m_session->timeoutMs(), "plain", DBus::Variant { String() }
        );

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        if (!iter.next())
          ERR(ParseError, "OpenSession returned no session");

        Option<String> session = iter.getString();

        if (!session)
          ERR(ParseError, "OpenSession returned no session");

        return *session;
      }

      fn defaultCollection(const DBus::Connection& connection) const -> Result<String> {
        Result<DBus::Message> reply = connection.call(SECRETS_BUS, SECRETS_PATH, SERVICE_IFACE, "ReadAlias", m_session->timeoutMs(), "default");

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        const Option<String> path = iter.getString();

        return path && *path != NO_PROMPT ? *path : String(DEFAULT_ALIAS);
      }

      /// Unlocks the objects, showing the keyring prompt when needed.
      fn unlock(const DBus::Connection& connection, const DBus::ObjectPathList& objects) const -> Result<> {
        Result<DBus::Message> reply = connection.call(SECRETS_BUS, SECRETS_PATH, SERVICE_IFACE, "Unlock", m_session->timeoutMs(), objects);

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        if (iter.next())
          if (Option<String> prompt = iter.getString(); prompt && *prompt != NO_PROMPT)
            if (Result<DBus::Message> completed = runPrompt(connection, *prompt); !completed)
              return Err(completed.error());

        return {};
      }

      /// Shows a Secret Service prompt and waits for it to complete.
      fn runPrompt(const DBus::Connection& connection, const String& prompt) const -> Result<DBus::Message> {
        const String rule = std::format("type='signal',interface='{}',member='Completed',path='{}'", PROMPT_IFACE, prompt);

        if (Result<> res = connection.addMatch(rule); !res)
          return Err(res.error());

        if (Result<DBus::Message> shown = connection.call(SECRETS_BUS, prompt.c_str(), PROMPT_IFACE, "Prompt", m_session->timeoutMs(), ""); !shown) {
          connection.removeMatch(rule);
          return Err(shown.error());
        }

        Result<DBus::Message> completed = connection.waitForSignal(
          PROMPT_IFACE, "Completed", [&prompt](const DBus::Message& message) -> bool { return message.path() == prompt; }, m_session->interactiveTimeoutMs()
        );

        connection.removeMatch(rule);

        if (!completed)
          return Err(completed.error());

        DBus::MessageIter iter = completed->iterInit();

        if (iter.getBool().value_or(false))
          ERR(PermissionDenied, "The keyring prompt was dismissed");

        return completed;
      }

      /// First item matching every attribute, unlocking it when necessary.
      fn findItem(const DBus::Connection& connection, const SecretAttributes& attributes) const -> Result<String> {
        Result<DBus::Message> reply = connection.call(
          SECRETS_BUS, SECRETS_PATH, SERVICE_IFACE, "SearchItems", m_session->timeoutMs(), DBus::StringDict(attributes.begin(), attributes.end())
        );

        if (!reply)
          return Err(reply.error());

        DBus::MessageIter iter = reply->iterInit();

        const DBus::StringList unlocked = iter.getStringList();

        if (!unlocked.empty())
          return unlocked.front();

        const DBus::StringList locked = iter.next() ? iter.getStringList() : DBus::StringList {};

        if (locked.empty())
          ERR(NotFound, "Secret not found");

        if (Result<> res = unlock(connection, { DBus::ObjectPath { locked.front() } }); !res)
          return Err(res.error());

        return locked.front();
      }

      fn label(const DBus::Connection& connection, const String& path) const -> String {
        Result<DBus::Message> reply = connection.getProperty(SECRETS_BUS, path.c_str(), ITEM_IFACE, "Label", m_session->timeoutMs());

        if (!reply) {
          debug_at(reply.error());
          return {};
        }

        DBus::MessageIter iter = reply->iterInit();

        return iter.getString().value_or("");
      }

      fn itemAttributes(const DBus::Connection& connection, const String& path) const -> Map<String, String> {
        Map<String, String> out;

        Result<DBus::Message> reply = connection.getProperty(SECRETS_BUS, path.c_str(), ITEM_IFACE, "Attributes", m_session->timeoutMs());

        if (!reply) {
          debug_at(reply.error());
          return out;
        }

        DBus::MessageIter iter = reply->iterInit();

        iter.forEachEntry([&out](const String& key, DBus::MessageIter& value) {
          if (Option<String> text = value.getString())
            out.emplace(key, std::move(*text));
        });

        return out;
      }
    };
  } // namespace

  fn MakeSecretStore(SessionPtr session) -> SharedPointer<ISecretStore> {
    return std::make_shared<SecretServiceStore>(std::move(session));
  }
} // namespace gnome_mcp::providers::gnome
