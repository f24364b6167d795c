#include "store/state_store.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>
#include "core/config/ids.hpp"
#include "core/io/atomic_file.hpp"
#include "core/logging/logger.hpp"

namespace statekeep::store {

using core::errors::ErrorCategory;
using core::errors::StateError;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kProjectFile = "project.json";
constexpr const char* kSectionsDir = "sections";
constexpr const char* kRecoveryDir = "recovery";

bool valid_project_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](const char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '.' || c == '-';
    });
}

bool valid_section_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](const char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

StateError validation_error(const std::string& message,
                            std::map<std::string, std::string> context) {
    return core::errors::make_error(ErrorCategory::Fatal, codes::kValidationFailed, message,
                                    std::move(context));
}

StateError project_not_found(const std::string& project_id) {
    auto error = core::errors::make_error(ErrorCategory::Fatal, codes::kProjectNotFound,
                                          "Project not found: " + project_id,
                                          {{"project_id", project_id}});
    error.hint = "Call initialize_project first.";
    return error;
}

StateError history_error(const std::string& project_id, const std::string& section,
                         const std::string& what) {
    return core::errors::make_error(ErrorCategory::Fatal, codes::kHistoryError,
                                    "Corrupt history: " + what,
                                    {{"project_id", project_id}, {"section", section}},
                                    core::errors::Severity::High);
}

StateError corrupt_section(const std::string& project_id, const std::string& section,
                           const std::string& what) {
    return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                    "Corrupt section record: " + what,
                                    {{"project_id", project_id}, {"section", section}},
                                    core::errors::Severity::High);
}

core::errors::Status check_ids(const std::string& project_id, const std::string& section) {
    if (!valid_project_id(project_id)) {
        return validation_error("Invalid project ID: '" + project_id + "'",
                                {{"project_id", project_id}});
    }
    if (!valid_section_name(section)) {
        return validation_error("Invalid section name: '" + section + "'",
                                {{"project_id", project_id}, {"section", section}});
    }
    return core::errors::ok();
}

core::errors::Result<HistoryEntry> history_entry_from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("sequence") || !doc.at("sequence").is_number_unsigned() ||
        !doc.contains("version") || !doc.at("version").is_number_unsigned()) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kHistoryError,
                                        "history entry without sequence/version");
    }
    HistoryEntry entry;
    try {
        entry.sequence = doc.at("sequence").get<std::uint64_t>();
        entry.version = doc.at("version").get<std::uint64_t>();
        entry.timestamp_ms = doc.value("timestamp_ms", static_cast<std::int64_t>(0));
        entry.snapshot = doc.contains("snapshot") ? doc.at("snapshot") : json();
        if (doc.contains("description") && doc.at("description").is_string()) {
            entry.description = doc.at("description").get<std::string>();
        }
    } catch (const json::exception& e) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kHistoryError, e.what());
    }
    return entry;
}

json section_to_json(const SectionSnapshot& snapshot) {
    json doc;
    doc["section"] = snapshot.section;
    doc["version"] = snapshot.version;
    doc["updated_at_ms"] = snapshot.updated_at_ms;
    doc["value"] = snapshot.value;
    doc["history"] = json::array();
    for (const auto& entry : snapshot.history) {
        doc["history"].push_back(to_json(entry));
    }
    return doc;
}

}  // namespace

json to_json(const HistoryEntry& entry) {
    json doc;
    doc["sequence"] = entry.sequence;
    doc["timestamp_ms"] = entry.timestamp_ms;
    doc["version"] = entry.version;
    doc["snapshot"] = entry.snapshot;
    if (entry.description.has_value()) {
        doc["description"] = entry.description.value();
    }
    return doc;
}

StateStore::StateStore(core::config::CoreConfig config, lock::FileLockManager& locks,
                       notify::ChangeNotifier* notifier)
    : config_(std::move(config)),
      locks_(locks),
      notifier_(notifier),
      holder_prefix_(core::config::generate_holder_id()) {}

std::filesystem::path StateStore::project_dir(const std::string& project_id) const {
    return config_.base_path / project_id;
}

std::filesystem::path StateStore::section_path(const std::string& project_id,
                                               const std::string& section) const {
    return project_dir(project_id) / kSectionsDir / (section + ".json");
}

std::string StateStore::next_holder_id() const {
    // One holder per write so concurrent writers in this process exclude
    // each other through the lock file like separate processes do.
    return core::config::generate_id(holder_prefix_, 6);
}

bool StateStore::project_exists(const std::string& project_id) const {
    if (!valid_project_id(project_id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(project_dir(project_id) / kProjectFile, ec);
}

core::errors::Status StateStore::check_project(const std::string& project_id) const {
    if (!valid_project_id(project_id)) {
        return validation_error("Invalid project ID: '" + project_id + "'",
                                {{"project_id", project_id}});
    }
    if (!project_exists(project_id)) {
        return project_not_found(project_id);
    }
    return core::errors::ok();
}

core::errors::Result<ProjectInfo> StateStore::initialize_project(const std::string& project_id,
                                                                 const std::string& name) {
    if (!valid_project_id(project_id)) {
        return validation_error("Invalid project ID: '" + project_id + "'",
                                {{"project_id", project_id}});
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.base_path, ec);
    if (ec) {
        return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                        "Unable to create base directory: " + ec.message(),
                                        {{"path", config_.base_path.string()}});
    }

    const std::string holder_id = next_holder_id();
    auto acquired = lock_project(project_id, holder_id);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    lock::ScopedLock guard(locks_, project_lock_resource(project_id), holder_id);

    if (project_exists(project_id)) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kProjectExists,
                                        "Project already exists: " + project_id,
                                        {{"project_id", project_id}});
    }

    // project.json marks a project. A directory without it is debris from an
    // interrupted init or a write that raced a delete.
    const auto dir = project_dir(project_id);
    if (std::filesystem::exists(dir, ec)) {
        LOG_WARN("StateStore: reclaiming " + dir.string() + " (no project metadata)");
        auto discarded = discard_directory(project_id, "orphan");
        if (core::errors::is_error(discarded)) {
            return core::errors::get_error(discarded);
        }
    }

    ProjectInfo info;
    info.id = project_id;
    info.name = name;
    info.created_at_ms = core::config::now_unix_ms();

    std::filesystem::create_directories(dir / kSectionsDir, ec);
    if (ec) {
        return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                        "Unable to create sections directory: " + ec.message(),
                                        {{"path", (dir / kSectionsDir).string()}});
    }
    json doc;
    doc["id"] = info.id;
    doc["name"] = info.name;
    doc["created_at_ms"] = info.created_at_ms;
    auto written = core::io::write_json_atomic(dir / kProjectFile, doc);
    if (core::errors::is_error(written)) {
        std::error_code cleanup_ec;
        std::filesystem::remove_all(dir, cleanup_ec);
        return core::errors::get_error(written);
    }

    LOG_INFO("StateStore: initialized project " + project_id);
    return info;
}

std::string StateStore::project_lock_resource(const std::string& project_id) const {
    // Beside the project directory, so moving the directory never moves the lock.
    return "." + project_id + ".project";
}

core::errors::Result<lock::LockRecord> StateStore::lock_project(const std::string& project_id,
                                                                const std::string& holder_id) {
    auto acquired = lock_resource(project_lock_resource(project_id), holder_id);
    if (core::errors::is_error(acquired)) {
        auto error = core::errors::get_error(acquired);
        error.context["project_id"] = project_id;
        return error;
    }
    return acquired;
}

core::errors::Status StateStore::discard_directory(const std::string& project_id,
                                                   const std::string& tag) {
    // Rename first so a concurrent reader sees the whole project or nothing.
    const auto dir = project_dir(project_id);
    const auto doomed =
        config_.base_path / ("." + project_id + "." + core::config::generate_id(tag));
    std::error_code ec;
    std::filesystem::rename(dir, doomed, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return core::errors::ok();
        }
        return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                        "Unable to move project directory aside: " +
                                            ec.message(),
                                        {{"project_id", project_id}});
    }
    std::filesystem::remove_all(doomed, ec);
    if (ec) {
        LOG_WARN("StateStore: leftover files in " + doomed.string() + ": " + ec.message());
    }
    return core::errors::ok();
}

core::errors::Status StateStore::delete_project(const std::string& project_id) {
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return checked;
    }

    const std::string holder_id = next_holder_id();
    auto acquired = lock_project(project_id, holder_id);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    lock::ScopedLock guard(locks_, project_lock_resource(project_id), holder_id);

    if (!project_exists(project_id)) {
        return project_not_found(project_id);
    }
    auto discarded = discard_directory(project_id, "deleted");
    if (core::errors::is_error(discarded)) {
        return discarded;
    }

    LOG_INFO("StateStore: deleted project " + project_id);
    if (notifier_ != nullptr) {
        notify::ChangeEvent event;
        event.project_id = project_id;
        event.change_type = notify::ChangeType::Delete;
        event.timestamp_ms = core::config::now_unix_ms();
        notifier_->publish(event);
        notifier_->drop_project(project_id);
    }
    return core::errors::ok();
}

core::errors::Result<ProjectInfo> StateStore::read_project(const std::string& project_id) const {
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    auto doc = core::io::read_json_file(project_dir(project_id) / kProjectFile, true);
    if (core::errors::is_error(doc)) {
        return core::errors::get_error(doc);
    }
    const auto& value = core::errors::get_value(doc);
    if (!value.has_value()) {
        return project_not_found(project_id);
    }
    if (!value->is_object()) {
        return corrupt_section(project_id, kProjectFile, "project metadata is not an object");
    }

    ProjectInfo info;
    try {
        info.id = value->value("id", project_id);
        info.name = value->value("name", std::string());
        info.created_at_ms = value->value("created_at_ms", static_cast<std::int64_t>(0));
    } catch (const json::exception& e) {
        return corrupt_section(project_id, kProjectFile, e.what());
    }
    return info;
}

core::errors::Result<std::vector<std::string>> StateStore::list_projects() const {
    std::vector<std::string> projects;
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.base_path, ec)) {
        return projects;
    }
    for (std::filesystem::directory_iterator it(config_.base_path, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (project_exists(name)) {
            projects.push_back(name);
        }
    }
    if (ec) {
        return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                        "Unable to list projects: " + ec.message(),
                                        {{"path", config_.base_path.string()}});
    }
    std::sort(projects.begin(), projects.end());
    return projects;
}

core::errors::Result<SectionSnapshot> StateStore::load_section(const std::string& project_id,
                                                               const std::string& section,
                                                               const bool include_history) const {
    SectionSnapshot snapshot;
    snapshot.project_id = project_id;
    snapshot.section = section;

    auto doc = core::io::read_json_file(section_path(project_id, section), true);
    if (core::errors::is_error(doc)) {
        auto error = core::errors::get_error(doc);
        error.context["project_id"] = project_id;
        error.context["section"] = section;
        return error;
    }
    const auto& record = core::errors::get_value(doc);
    if (!record.has_value()) {
        return snapshot;
    }

    if (!record->is_object() || !record->contains("version") ||
        !record->at("version").is_number_unsigned() || !record->contains("value")) {
        return corrupt_section(project_id, section, "missing version or value");
    }
    snapshot.exists = true;
    snapshot.version = record->at("version").get<std::uint64_t>();
    snapshot.value = record->at("value");
    if (record->contains("updated_at_ms") && record->at("updated_at_ms").is_number()) {
        snapshot.updated_at_ms = record->at("updated_at_ms").get<std::int64_t>();
    }

    if (!include_history) {
        return snapshot;
    }
    if (!record->contains("history")) {
        return snapshot;
    }
    const auto& history = record->at("history");
    if (!history.is_array()) {
        return history_error(project_id, section, "history is not an array");
    }
    snapshot.history.reserve(history.size());
    for (const auto& item : history) {
        auto entry = history_entry_from_json(item);
        if (core::errors::is_error(entry)) {
            return history_error(project_id, section, core::errors::get_error(entry).message);
        }
        snapshot.history.push_back(core::errors::take_value(entry));
    }
    return snapshot;
}

core::errors::Result<SectionSnapshot> StateStore::read_section(const std::string& project_id,
                                                               const std::string& section,
                                                               const ReadOptions options) const {
    auto ids = check_ids(project_id, section);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    auto loaded = load_section(project_id, section, options.include_history);
    if (core::errors::is_error(loaded)) {
        return loaded;
    }
    if (!core::errors::get_value(loaded).exists && !options.allow_missing) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kSectionNotFound,
                                        "Section not found: " + section,
                                        {{"project_id", project_id}, {"section", section}});
    }
    return loaded;
}

core::errors::Result<lock::LockRecord> StateStore::lock_resource(const std::string& resource,
                                                                 const std::string& holder_id) {
    return locks_.acquire(resource, holder_id,
                          std::chrono::milliseconds(config_.lock_timeout_ms));
}

void StateStore::register_validator(const std::string& section, Validator validator) {
    std::lock_guard<std::mutex> lock(validators_mutex_);
    validators_[section] = std::move(validator);
}

core::errors::Status StateStore::run_validator(const std::string& project_id,
                                               const std::string& section,
                                               const json& value) const {
    Validator validator;
    {
        std::lock_guard<std::mutex> lock(validators_mutex_);
        auto it = validators_.find(section);
        if (it == validators_.end()) {
            return core::errors::ok();
        }
        validator = it->second;
    }
    auto result = validator(project_id, value);
    if (!core::errors::is_error(result)) {
        return result;
    }
    auto error = core::errors::get_error(result);
    error.code = codes::kValidationFailed;
    error.category = ErrorCategory::Fatal;
    error.context["project_id"] = project_id;
    error.context["section"] = section;
    return error;
}

core::errors::Result<SectionSnapshot> StateStore::update_section_with(
    const std::string& project_id, const std::string& section, const Mutator& mutator) {
    auto ids = check_ids(project_id, section);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string resource = project_id + "/" + kSectionsDir + "/" + section + ".json";
    const std::string holder_id = next_holder_id();
    auto acquired = lock_resource(resource, holder_id);
    if (core::errors::is_error(acquired)) {
        auto error = core::errors::get_error(acquired);
        error.context["project_id"] = project_id;
        error.context["section"] = section;
        return error;
    }
    lock::ScopedLock guard(locks_, resource, holder_id);
    // Deleted while we waited for the lock.
    if (!project_exists(project_id)) {
        return project_not_found(project_id);
    }

    auto loaded = load_section(project_id, section, true);
    if (core::errors::is_error(loaded)) {
        return loaded;
    }
    const SectionSnapshot current = core::errors::take_value(loaded);

    auto mutated = mutator(current);
    if (core::errors::is_error(mutated)) {
        return core::errors::get_error(mutated);
    }
    Mutation mutation = core::errors::take_value(mutated);

    auto valid = run_validator(project_id, section, mutation.value);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    SectionSnapshot next;
    next.project_id = project_id;
    next.section = section;
    next.exists = true;
    next.value = std::move(mutation.value);
    next.version = current.version + 1;
    next.updated_at_ms = core::config::now_unix_ms();
    next.history = current.history;

    HistoryEntry entry;
    entry.sequence = current.history.empty() ? next.version : current.history.back().sequence + 1;
    entry.timestamp_ms = next.updated_at_ms;
    entry.version = next.version;
    entry.snapshot = next.value;
    entry.description = std::move(mutation.description);
    next.history.push_back(std::move(entry));
    if (next.history.size() > config_.max_history_entries) {
        const auto excess = next.history.size() - config_.max_history_entries;
        next.history.erase(next.history.begin(),
                           next.history.begin() + static_cast<std::ptrdiff_t>(excess));
    }

    // A heartbeat that lost the lock means someone else may be writing.
    auto held = locks_.verify_held(resource, holder_id);
    if (core::errors::is_error(held)) {
        auto error = core::errors::get_error(held);
        error.context["project_id"] = project_id;
        error.context["section"] = section;
        return error;
    }

    auto written = core::io::write_json_atomic(section_path(project_id, section),
                                               section_to_json(next));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto released = guard.release();
    if (core::errors::is_error(released)) {
        LOG_WARN("StateStore: committed " + project_id + "/" + section +
                 " but release failed " +
                 core::errors::describe(core::errors::get_error(released)));
    }
    LOG_DEBUG("StateStore: committed " + project_id + "/" + section + " v" +
              std::to_string(next.version));

    if (notifier_ != nullptr) {
        notify::ChangeEvent event;
        event.project_id = project_id;
        event.section = section;
        event.change_type =
            current.exists ? notify::ChangeType::Update : notify::ChangeType::Create;
        if (current.exists) {
            event.previous_value = current.value;
        }
        event.new_value = next.value;
        event.version = next.version;
        event.timestamp_ms = next.updated_at_ms;
        notifier_->publish(event);
    }
    return next;
}

core::errors::Result<SectionSnapshot> StateStore::write_section(
    const std::string& project_id, const std::string& section, json value,
    std::optional<std::string> description) {
    return update_section_with(
        project_id, section,
        [&value, &description](const SectionSnapshot&) -> core::errors::Result<Mutation> {
            return Mutation{std::move(value), std::move(description)};
        });
}

core::errors::Result<SectionSnapshot> StateStore::update_section(const std::string& project_id,
                                                                 const std::string& section,
                                                                 const json& patch,
                                                                 UpdateOptions options) {
    return update_section_with(
        project_id, section,
        [&](const SectionSnapshot& current) -> core::errors::Result<Mutation> {
            if (!options.merge || !current.exists) {
                return Mutation{patch, options.description};
            }
            if (!current.value.is_object() || !patch.is_object()) {
                return validation_error(
                    "Merge update requires object values on both sides.",
                    {{"project_id", project_id}, {"section", section}});
            }
            json merged = current.value;
            for (auto it = patch.begin(); it != patch.end(); ++it) {
                merged[it.key()] = it.value();
            }
            return Mutation{std::move(merged), options.description};
        });
}

core::errors::Result<std::vector<HistoryEntry>> StateStore::get_history(
    const std::string& project_id, const std::string& section) const {
    auto loaded = read_section(project_id, section, ReadOptions{true, true});
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    return core::errors::take_value(loaded).history;
}

core::errors::Result<std::vector<HistoryEntry>> StateStore::recent_activity(
    const std::string& project_id, const std::string& section, const std::size_t limit) const {
    auto history = get_history(project_id, section);
    if (core::errors::is_error(history)) {
        return history;
    }
    auto entries = core::errors::take_value(history);
    std::reverse(entries.begin(), entries.end());
    if (entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

core::errors::Result<std::uint64_t> StateStore::section_version(
    const std::string& project_id, const std::string& section) const {
    auto loaded = read_section(project_id, section, ReadOptions{true, false});
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    return core::errors::get_value(loaded).version;
}

core::errors::Result<std::vector<std::string>> StateStore::list_sections(
    const std::string& project_id) const {
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    std::vector<std::string> sections;
    const auto dir = project_dir(project_id) / kSectionsDir;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return sections;
    }
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json") {
            continue;
        }
        const auto name = path.stem().string();
        if (valid_section_name(name)) {
            sections.push_back(name);
        }
    }
    if (ec) {
        return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                        "Unable to list sections: " + ec.message(),
                                        {{"project_id", project_id}});
    }
    std::sort(sections.begin(), sections.end());
    return sections;
}

core::errors::Result<std::optional<json>> StateStore::read_document(
    const std::string& project_id, const std::string& name) const {
    auto ids = check_ids(project_id, name);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return core::io::read_json_file(project_dir(project_id) / kRecoveryDir / (name + ".json"),
                                    true);
}

core::errors::Result<json> StateStore::update_document(const std::string& project_id,
                                                       const std::string& name,
                                                       const DocumentMutator& mutator) {
    auto ids = check_ids(project_id, name);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    auto checked = check_project(project_id);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string resource = project_id + "/" + kRecoveryDir + "/" + name + ".json";
    const auto path = project_dir(project_id) / kRecoveryDir / (name + ".json");
    const std::string holder_id = next_holder_id();
    auto acquired = lock_resource(resource, holder_id);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    lock::ScopedLock guard(locks_, resource, holder_id);
    if (!project_exists(project_id)) {
        return project_not_found(project_id);
    }

    auto current = core::io::read_json_file(path, true);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    auto next = mutator(core::errors::get_value(current));
    if (core::errors::is_error(next)) {
        return next;
    }

    auto held = locks_.verify_held(resource, holder_id);
    if (core::errors::is_error(held)) {
        return core::errors::get_error(held);
    }
    auto written = core::io::write_json_atomic(path, core::errors::get_value(next));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    auto released = guard.release();
    if (core::errors::is_error(released)) {
        LOG_WARN("StateStore: wrote " + path.string() + " but release failed " +
                 core::errors::describe(core::errors::get_error(released)));
    }
    return next;
}

}  // namespace statekeep::store
