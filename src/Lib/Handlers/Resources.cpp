#include <algorithm> // std::ranges::{sort, remove_if}
#include <chrono>    // std::chrono::{system_clock, floor, days}

#include "GnomeMcp/Handlers/Handlers.hpp"
#include "GnomeMcp/Utils/Logging.hpp"

#include "Factories.hpp"

using namespace gnome_mcp::utils::types;
using gnome_mcp::core::Arguments;
using gnome_mcp::core::ICapabilityHandler;
using gnome_mcp::core::ResolvedOptions;
using gnome_mcp::providers::Task;
using gnome_mcp::providers::Timestamp;
using gnome_mcp::utils::error::GmcpError;
using enum gnome_mcp::utils::error::GmcpErrorCode;

namespace gnome_mcp::handlers {
  namespace {
    using providers::ApplicationInfo;
    using providers::Contact;
    using providers::Event;
    using providers::IApplicationProvider;
    using providers::IPersonalDataProvider;
    using providers::ISystemInfoProvider;
    using providers::SystemInfo;

    fn Now() -> Timestamp {
      return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

    fn Nullable(const Option<String>& value) -> mcp::json {
      return value ? mcp::json(*value) : mcp::json(nullptr);
    }

    class SystemInfoHandler final : public ICapabilityHandler {
     public:
      explicit SystemInfoHandler(SharedPointer<ISystemInfoProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        Result<ISystemInfoProvider*> provider = Require(m_provider, "system information");

        if (!provider)
          return Err(provider.error());

        Result<SystemInfo> info = (*provider)->getSystemInfo();

        if (!info)
          return Err(info.error());

        return mcp::json {
          {                   "os", { { "name", info->osName }, { "version", Nullable(info->osVersion) } } },
          {               "kernel", info->kernel },
          {         "architecture", info->architecture },
          {             "hostname", info->hostname },
          {  "desktop_environment", Nullable(info->desktop) },
          {  "gnome_shell_version", Nullable(info->shellVersion) },
          {       "uptime_seconds", info->uptimeSeconds },
          {               "memory", { { "total_bytes", info->totalMemoryBytes }, { "available_bytes", info->availableMemoryBytes } } },
        };
      }

     private:
      SharedPointer<ISystemInfoProvider> m_provider;
    };

    class ApplicationsHandler final : public ICapabilityHandler {
     public:
      explicit ApplicationsHandler(SharedPointer<IApplicationProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& /*options*/) -> Result<mcp::json> override {
        Result<IApplicationProvider*> provider = Require(m_provider, "application");

        if (!provider)
          return Err(provider.error());

        Result<Vec<ApplicationInfo>> apps = (*provider)->listInstalled();

        if (!apps)
          return Err(apps.error());

        std::ranges::sort(*apps, {}, &ApplicationInfo::name);

        mcp::json list = mcp::json::array();

        for (const ApplicationInfo& app : *apps)
          list.push_back({
            {          "id", app.id },
            {        "name", app.name },
            { "description", Nullable(app.description) },
            {        "exec", Nullable(app.exec) },
            {        "icon", Nullable(app.icon) },
            {  "categories", app.categories },
          });

        return mcp::json {
          { "applications", list },
          {        "count", apps->size() },
        };
      }

     private:
      SharedPointer<IApplicationProvider> m_provider;
    };

    class CalendarHandler final : public ICapabilityHandler {
     public:
      explicit CalendarHandler(SharedPointer<IPersonalDataProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& options) -> Result<mcp::json> override {
        using std::chrono::days;

        Result<IPersonalDataProvider*> provider = Require(m_provider, "personal data");

        if (!provider)
          return Err(provider.error());

        const Timestamp now  = Now();
        const Timestamp from = now - days { options.getInteger("days_behind") };
        const Timestamp to   = now + days { options.getInteger("days_ahead") };

        Result<Vec<Event>> events = (*provider)->listEvents(from, to);

        if (!events)
          return Err(events.error());

        mcp::json list = mcp::json::array();

        for (const Event& event : *events)
          list.push_back(providers::ToJson(event));

        return mcp::json {
          { "events", list },
          {  "count", events->size() },
          {  "range", { { "start", providers::ical::FormatTimestamp(from) }, { "end", providers::ical::FormatTimestamp(to) } } },
        };
      }

     private:
      SharedPointer<IPersonalDataProvider> m_provider;
    };

    class TasksHandler final : public ICapabilityHandler {
     public:
      explicit TasksHandler(SharedPointer<IPersonalDataProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& options) -> Result<mcp::json> override {
        Result<IPersonalDataProvider*> provider = Require(m_provider, "personal data");

        if (!provider)
          return Err(provider.error());

        Result<Vec<Task>> tasks = (*provider)->listTasks();

        if (!tasks)
          return Err(tasks.error());

        const Vec<Task> filtered = FilterTasks(
          std::move(*tasks),
          options.getBool("include_completed"),
          options.getBool("include_cancelled"),
          options.getInteger("due_within_days"),
          Now()
        );

        mcp::json list = mcp::json::array();

        for (const Task& task : filtered)
          list.push_back(providers::ToJson(task));

        return mcp::json {
          { "tasks", list },
          { "count", filtered.size() },
        };
      }

     private:
      SharedPointer<IPersonalDataProvider> m_provider;
    };

    class ContactsHandler final : public ICapabilityHandler {
     public:
      explicit ContactsHandler(SharedPointer<IPersonalDataProvider> provider)
        : m_provider(std::move(provider)) {}

      fn invoke(const Arguments& /*args*/, const ResolvedOptions& options) -> Result<mcp::json> override {
        Result<IPersonalDataProvider*> provider = Require(m_provider, "personal data");

        if (!provider)
          return Err(provider.error());

        Result<Vec<Contact>> contacts = (*provider)->listContacts();

        if (!contacts)
          return Err(contacts.error());

        const bool emailOnly = options.getBool("email_only");

        mcp::json list = mcp::json::array();

        for (const Contact& contact : *contacts)
          if (!emailOnly || !contact.emails.empty())
            list.push_back(providers::ToJson(contact));

        return mcp::json {
          { "contacts", list },
          {    "count", list.size() },
        };
      }

     private:
      SharedPointer<IPersonalDataProvider> m_provider;
    };
  } // namespace

  fn FilterTasks(Vec<Task> tasks, const bool includeCompleted, const bool includeCancelled, const i64 dueWithinDays, const Timestamp& now)
    -> Vec<Task> {
    const Timestamp dueLimit = now + std::chrono::days { dueWithinDays };

    const auto dropped = std::ranges::remove_if(tasks, [&](const Task& task) {
      if (!includeCompleted && task.isCompleted())
        return true;

      if (!includeCancelled && task.isCancelled())
        return true;

      return dueWithinDays > 0 && task.dueDate && *task.dueDate > dueLimit;
    });

    tasks.erase(dropped.begin(), dropped.end());

    return tasks;
  }

  fn MakeSystemInfo(SharedPointer<ISystemInfoProvider> provider) -> HandlerPtr {
    return std::make_unique<SystemInfoHandler>(std::move(provider));
  }

  fn MakeApplications(SharedPointer<IApplicationProvider> provider) -> HandlerPtr {
    return std::make_unique<ApplicationsHandler>(std::move(provider));
  }

  fn MakeCalendar(SharedPointer<IPersonalDataProvider> provider) -> HandlerPtr {
    return std::make_unique<CalendarHandler>(std::move(provider));
  }

  fn MakeTasks(SharedPointer<IPersonalDataProvider> provider) -> HandlerPtr {
    return std::make_unique<TasksHandler>(std::move(provider));
  }

  fn MakeContacts(SharedPointer<IPersonalDataProvider> provider) -> HandlerPtr {
    return std::make_unique<ContactsHandler>(std::move(provider));
  }
} // namespace gnome_mcp::handlers
