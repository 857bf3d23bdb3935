#include "beacon/storage/sqlite/sqlite_profile_repository.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace beacon::storage::sqlite {

namespace {

constexpr const char* kProviderKind = "provider";
constexpr const char* kSeekerKind = "seeker";

using WriteResult = core::Result<bool, core::StorageError>;

WriteResult unavailable(SqliteDb& db) {
  // Best effort: the write already failed, rollback errors add nothing.
  (void)db.exec("ROLLBACK");
  return WriteResult::err(core::StorageError::kUnavailable);
}

std::vector<std::string> parse_tags(const std::string& text) {
  try {
    return nlohmann::json::parse(text).get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception&) {
    return {};
  }
}

constexpr const char* kProviderColumns = R"(
    SELECT provider_id, name, current_role, current_employer, current_industry, location,
           alma_mater, help_offered_json, help_details, pref_location, pref_alma_mater, pref_gpa,
           pref_industry, pref_help_type, pref_path_alignment
      FROM providers )";

constexpr const char* kSeekerColumns = R"(
    SELECT seeker_id, name, current_role, current_employer, current_industry, location,
           help_needed_json, gpa, goal, context
      FROM seekers )";

domain::Provider read_provider_row(const PreparedStatement& stmt) {
  domain::Provider provider;
  provider.provider_id = core::ProviderId{stmt.column_text(0)};
  provider.name = stmt.column_text(1);
  provider.current_role = stmt.column_text(2);
  provider.current_employer = stmt.column_text(3);
  provider.current_industry = stmt.column_text(4);
  provider.location = stmt.column_text(5);
  provider.alma_mater = stmt.column_optional_text(6);
  provider.help_offered = parse_tags(stmt.column_text(7));
  provider.help_details = stmt.column_text(8);
  provider.preferences.location = stmt.column_optional_int(9);
  provider.preferences.alma_mater = stmt.column_optional_int(10);
  provider.preferences.gpa = stmt.column_optional_int(11);
  provider.preferences.industry = stmt.column_optional_int(12);
  provider.preferences.help_type = stmt.column_optional_int(13);
  provider.preferences.path_alignment = stmt.column_optional_int(14);
  return provider;
}

domain::Seeker read_seeker_row(const PreparedStatement& stmt) {
  domain::Seeker seeker;
  seeker.seeker_id = core::SeekerId{stmt.column_text(0)};
  seeker.name = stmt.column_text(1);
  seeker.current_role = stmt.column_text(2);
  seeker.current_employer = stmt.column_text(3);
  seeker.current_industry = stmt.column_text(4);
  seeker.location = stmt.column_text(5);
  seeker.help_needed = parse_tags(stmt.column_text(6));
  seeker.gpa = stmt.column_optional_double(7);
  seeker.goal = stmt.column_text(8);
  seeker.context = stmt.column_text(9);
  return seeker;
}

}  // namespace

SqliteProfileRepository::SqliteProfileRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::StorageError> SqliteProfileRepository::upsert_provider(
    const domain::Provider& provider) {
  if (!db_->exec("BEGIN TRANSACTION").has_value()) {
    return WriteResult::err(core::StorageError::kUnavailable);
  }

  const char* sql = R"(
    INSERT INTO providers
      (provider_id, name, current_role, current_employer, current_industry, location,
       alma_mater, help_offered_json, help_details, pref_location, pref_alma_mater, pref_gpa,
       pref_industry, pref_help_type, pref_path_alignment)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(provider_id) DO UPDATE SET
      name = excluded.name,
      current_role = excluded.current_role,
      current_employer = excluded.current_employer,
      current_industry = excluded.current_industry,
      location = excluded.location,
      alma_mater = excluded.alma_mater,
      help_offered_json = excluded.help_offered_json,
      help_details = excluded.help_details,
      pref_location = excluded.pref_location,
      pref_alma_mater = excluded.pref_alma_mater,
      pref_gpa = excluded.pref_gpa,
      pref_industry = excluded.pref_industry,
      pref_help_type = excluded.pref_help_type,
      pref_path_alignment = excluded.pref_path_alignment
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return unavailable(*db_);
  }

  const nlohmann::json help_json = provider.help_offered;
  const auto& prefs = provider.preferences;
  stmt.bind_text(1, provider.provider_id.value);
  stmt.bind_text(2, provider.name);
  stmt.bind_text(3, provider.current_role);
  stmt.bind_text(4, provider.current_employer);
  stmt.bind_text(5, provider.current_industry);
  stmt.bind_text(6, provider.location);
  stmt.bind_optional_text(7, provider.alma_mater);
  stmt.bind_text(8, help_json.dump());
  stmt.bind_text(9, provider.help_details);
  stmt.bind_optional_int(10, prefs.location);
  stmt.bind_optional_int(11, prefs.alma_mater);
  stmt.bind_optional_int(12, prefs.gpa);
  stmt.bind_optional_int(13, prefs.industry);
  stmt.bind_optional_int(14, prefs.help_type);
  stmt.bind_optional_int(15, prefs.path_alignment);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return unavailable(*db_);
  }
  if (!replace_positions(kProviderKind, provider.provider_id.value, provider.past_positions)) {
    return unavailable(*db_);
  }

  if (!db_->exec("COMMIT").has_value()) {
    return unavailable(*db_);
  }
  return WriteResult::ok(true);
}

core::Result<bool, core::StorageError> SqliteProfileRepository::upsert_seeker(
    const domain::Seeker& seeker) {
  if (!db_->exec("BEGIN TRANSACTION").has_value()) {
    return WriteResult::err(core::StorageError::kUnavailable);
  }

  const char* sql = R"(
    INSERT INTO seekers
      (seeker_id, name, current_role, current_employer, current_industry, location,
       help_needed_json, gpa, goal, context)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(seeker_id) DO UPDATE SET
      name = excluded.name,
      current_role = excluded.current_role,
      current_employer = excluded.current_employer,
      current_industry = excluded.current_industry,
      location = excluded.location,
      help_needed_json = excluded.help_needed_json,
      gpa = excluded.gpa,
      goal = excluded.goal,
      context = excluded.context
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return unavailable(*db_);
  }

  const nlohmann::json needs_json = seeker.help_needed;
  stmt.bind_text(1, seeker.seeker_id.value);
  stmt.bind_text(2, seeker.name);
  stmt.bind_text(3, seeker.current_role);
  stmt.bind_text(4, seeker.current_employer);
  stmt.bind_text(5, seeker.current_industry);
  stmt.bind_text(6, seeker.location);
  stmt.bind_text(7, needs_json.dump());
  stmt.bind_optional_double(8, seeker.gpa);
  stmt.bind_text(9, seeker.goal);
  stmt.bind_text(10, seeker.context);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return unavailable(*db_);
  }
  if (!replace_positions(kSeekerKind, seeker.seeker_id.value, seeker.past_positions)) {
    return unavailable(*db_);
  }

  if (!db_->exec("COMMIT").has_value()) {
    return unavailable(*db_);
  }
  return WriteResult::ok(true);
}

std::optional<domain::Provider> SqliteProfileRepository::get_provider(
    const core::ProviderId& id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kProviderColumns) + "WHERE provider_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  auto provider = read_provider_row(stmt);
  provider.past_positions = load_positions(kProviderKind, provider.provider_id.value);
  return provider;
}

std::optional<domain::Seeker> SqliteProfileRepository::get_seeker(const core::SeekerId& id) const {
  PreparedStatement stmt(db_->connection(), std::string(kSeekerColumns) + "WHERE seeker_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  auto seeker = read_seeker_row(stmt);
  seeker.past_positions = load_positions(kSeekerKind, seeker.seeker_id.value);
  return seeker;
}

std::vector<domain::Provider> SqliteProfileRepository::list_providers() const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kProviderColumns) + "ORDER BY provider_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Provider> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_provider_row(stmt));
  }
  for (auto& provider : result) {
    provider.past_positions = load_positions(kProviderKind, provider.provider_id.value);
  }
  return result;
}

std::vector<domain::Seeker> SqliteProfileRepository::list_seekers() const {
  PreparedStatement stmt(db_->connection(), std::string(kSeekerColumns) + "ORDER BY seeker_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Seeker> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_seeker_row(stmt));
  }
  for (auto& seeker : result) {
    seeker.past_positions = load_positions(kSeekerKind, seeker.seeker_id.value);
  }
  return result;
}

bool SqliteProfileRepository::replace_positions(const char* owner_kind,
                                                const std::string& owner_id,
                                                const std::vector<domain::PastPosition>& positions) {
  PreparedStatement del_stmt(db_->connection(),
                             "DELETE FROM past_positions WHERE owner_kind = ? AND owner_id = ?");
  if (!del_stmt.is_valid()) {
    return false;
  }
  del_stmt.bind_text(1, owner_kind);
  del_stmt.bind_text(2, owner_id);
  if (sqlite3_step(del_stmt.get()) != SQLITE_DONE) {
    return false;
  }

  const char* sql = R"(
    INSERT INTO past_positions
      (owner_kind, owner_id, idx, sort_order, title, organization, duration, is_education)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
  )";
  PreparedStatement ins_stmt(db_->connection(), sql);
  if (!ins_stmt.is_valid()) {
    return false;
  }

  for (std::size_t i = 0; i < positions.size(); ++i) {
    const auto& position = positions[i];
    ins_stmt.bind_text(1, owner_kind);
    ins_stmt.bind_text(2, owner_id);
    ins_stmt.bind_int(3, static_cast<int>(i));
    ins_stmt.bind_int(4, position.order);
    ins_stmt.bind_text(5, position.title);
    ins_stmt.bind_text(6, position.organization);
    ins_stmt.bind_text(7, position.duration);
    ins_stmt.bind_int(8, position.is_education ? 1 : 0);

    if (sqlite3_step(ins_stmt.get()) != SQLITE_DONE) {
      return false;
    }
    ins_stmt.reset();
  }
  return true;
}

std::vector<domain::PastPosition> SqliteProfileRepository::load_positions(
    const char* owner_kind, const std::string& owner_id) const {
  const char* sql = R"(
    SELECT sort_order, title, organization, duration, is_education
      FROM past_positions WHERE owner_kind = ? AND owner_id = ?
     ORDER BY sort_order, idx
  )";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  stmt.bind_text(1, owner_kind);
  stmt.bind_text(2, owner_id);

  std::vector<domain::PastPosition> positions;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    domain::PastPosition position;
    position.order = sqlite3_column_int(stmt.get(), 0);
    position.title = stmt.column_text(1);
    position.organization = stmt.column_text(2);
    position.duration = stmt.column_text(3);
    position.is_education = sqlite3_column_int(stmt.get(), 4) != 0;
    positions.push_back(std::move(position));
  }
  return positions;
}

}  // namespace beacon::storage::sqlite
