#include <citegraph/storage_writer.h>

#include <citegraph/corpus_store.h>
#include <citegraph/graph_assembler.h>
#include <citegraph/record_codec.h>

#include <optional>
#include <stdexcept>
#include <utility>

namespace citegraph {
namespace {

constexpr char kCheckpointKey[] = "checkpoint";

const std::vector<std::string> &SchemaStatements() {
  static const std::vector<std::string> statements = {
      R"(CREATE TABLE IF NOT EXISTS "primary" (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS "citations" (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS "reverse_citations" (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS "chains" (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS "metadata" (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS build_documents (id TEXT PRIMARY KEY, title TEXT NOT NULL, url TEXT NOT NULL, text TEXT NOT NULL, word_count INTEGER NOT NULL, citation_count INTEGER NOT NULL, unresolved_count INTEGER NOT NULL) WITHOUT ROWID;)",
      R"(CREATE TABLE IF NOT EXISTS build_edges (source TEXT NOT NULL, target TEXT NOT NULL, PRIMARY KEY (source, target)) WITHOUT ROWID;)",
      R"(CREATE INDEX IF NOT EXISTS build_edges_by_target ON build_edges (target, source);)",
      R"(CREATE TABLE IF NOT EXISTS build_checkpoint (key TEXT PRIMARY KEY, value TEXT NOT NULL) WITHOUT ROWID;)"};
  return statements;
}

std::string InsertInto(StoreName store) {
  return "INSERT OR REPLACE INTO \"" + StoreTableName(store) +
         "\" (key, value) VALUES (?, ?);";
}

std::size_t UnresolvedCount(const std::vector<RawCitation> &citations) {
  std::size_t count = 0;
  for (const auto &citation : citations) {
    if (citation.kind == RelationshipKind::kUnknown) {
      ++count;
    }
  }
  return count;
}

// Resolved edges staged in the partial file, queried one source at a time
// so chain expansion never needs the whole graph in memory.
class StagedEdgeAdjacency : public CitationAdjacency {
public:
  explicit StagedEdgeAdjacency(SqliteDatabase &database)
      : statement_(database.Prepare(
            "SELECT target FROM build_edges WHERE source = ? ORDER BY "
            "target;")) {}

  std::vector<std::string> References(const std::string &id) const override {
    statement_.Bind(1, id);
    std::vector<std::string> targets;
    while (statement_.Step()) {
      targets.push_back(statement_.ColumnText(0));
    }
    statement_.Reset();
    return targets;
  }

private:
  mutable SqliteStatement statement_;
};

class ChainMemberLookup {
public:
  explicit ChainMemberLookup(SqliteDatabase &database)
      : statement_(database.Prepare(
            "SELECT title, url, text, word_count FROM build_documents WHERE "
            "id = ?;")) {}

  ChainMember Find(const std::string &id) {
    ChainMember member;
    member.id = id;
    statement_.Bind(1, id);
    if (statement_.Step()) {
      member.title = statement_.ColumnText(0);
      member.url = statement_.ColumnText(1);
      member.text = statement_.ColumnText(2);
      member.word_count = static_cast<std::size_t>(statement_.ColumnInt64(3));
    }
    statement_.Reset();
    return member;
  }

private:
  SqliteStatement statement_;
};

} // namespace

StorageWriter::StorageWriter(std::filesystem::path output_dir,
                             std::string corpus_id,
                             std::shared_ptr<Logger> logger)
    : output_dir_(std::move(output_dir)), corpus_id_(std::move(corpus_id)),
      final_path_(CorpusStorePath(output_dir_, corpus_id_)),
      partial_path_(PartialCorpusStorePath(output_dir_, corpus_id_)),
      logger_(EnsureLogger(std::move(logger))) {
  if (corpus_id_.empty()) {
    throw std::invalid_argument("Storage writer requires a corpus id");
  }
}

SqliteDatabase &StorageWriter::Database() {
  if (!database_) {
    throw std::logic_error("Storage writer used before Open()");
  }
  return *database_;
}

BuildCheckpoint StorageWriter::Open() {
  std::filesystem::create_directories(output_dir_);
  database_ = std::make_unique<SqliteDatabase>(
      partial_path_, SqliteDatabase::Mode::kReadWrite);
  database_->Execute("PRAGMA journal_mode=DELETE;");
  database_->Execute("PRAGMA synchronous=FULL;");
  EnsureSchema();

  std::optional<BuildCheckpoint> stored;
  {
    auto statement = database_->Prepare(
        "SELECT value FROM build_checkpoint WHERE key = ?;");
    statement.Bind(1, std::string(kCheckpointKey));
    if (statement.Step()) {
      stored = DecodeCheckpoint(statement.ColumnText(0));
    }
  }

  if (stored) {
    if (stored->corpus_id != corpus_id_) {
      throw std::runtime_error("Checkpoint in " + partial_path_.string() +
                               " belongs to corpus '" + stored->corpus_id +
                               "', not '" + corpus_id_ + "'");
    }
    logger_->Log(LogLevel::kDebug, "storage.open",
                 {{"path", partial_path_.string()}, {"mode", "resume"}});
    return *stored;
  }

  ClearAll();
  logger_->Log(LogLevel::kDebug, "storage.open",
               {{"path", partial_path_.string()}, {"mode", "fresh"}});
  BuildCheckpoint fresh;
  fresh.corpus_id = corpus_id_;
  return fresh;
}

void StorageWriter::EnsureSchema() {
  for (const auto &statement : SchemaStatements()) {
    database_->Execute(statement);
  }
}

void StorageWriter::ClearAll() {
  SqliteTransaction transaction(*database_);
  for (const auto store : AllStores()) {
    database_->Execute("DELETE FROM \"" + StoreTableName(store) + "\";");
  }
  database_->Execute("DELETE FROM build_documents;");
  database_->Execute("DELETE FROM build_edges;");
  database_->Execute("DELETE FROM build_checkpoint;");
  transaction.Commit();
}

void StorageWriter::WriteCheckpoint(const BuildCheckpoint &checkpoint) {
  auto statement = Database().Prepare(
      "INSERT OR REPLACE INTO build_checkpoint (key, value) VALUES (?, ?);");
  statement.Bind(1, std::string(kCheckpointKey))
      .Bind(2, EncodeCheckpoint(checkpoint));
  statement.Run();
}

void StorageWriter::CommitBatch(
    const std::vector<AnnotatedDocument> &documents,
    const std::map<std::string, ForwardIndexEntry> &forward,
    const BuildCheckpoint &checkpoint) {
  auto &database = Database();
  SqliteTransaction transaction(database);

  auto insert_primary = database.Prepare(InsertInto(StoreName::kPrimary));
  auto insert_citations = database.Prepare(InsertInto(StoreName::kCitations));
  auto delete_citations =
      database.Prepare(R"(DELETE FROM "citations" WHERE key = ?;)");
  auto delete_edges =
      database.Prepare("DELETE FROM build_edges WHERE source = ?;");
  auto insert_edge = database.Prepare(
      "INSERT OR IGNORE INTO build_edges (source, target) VALUES (?, ?);");
  auto insert_document = database.Prepare(
      "INSERT OR REPLACE INTO build_documents (id, title, url, text, "
      "word_count, citation_count, unresolved_count) VALUES (?, ?, ?, ?, ?, "
      "?, ?);");

  for (const auto &annotated : documents) {
    const auto &document = annotated.document;
    insert_primary.Bind(1, document.id)
        .Bind(2, EncodePrimaryRecord(document, annotated.enrichment,
                                     annotated.citations.size()));
    insert_primary.Run();

    // A repeated id replaces the earlier record wholesale.
    delete_citations.Bind(1, document.id);
    delete_citations.Run();
    delete_edges.Bind(1, document.id);
    delete_edges.Run();

    insert_document.Bind(1, document.id)
        .Bind(2, document.display_title)
        .Bind(3, document.source_url)
        .Bind(4, SearchableText(document))
        .Bind(5, static_cast<std::int64_t>(document.word_count))
        .Bind(6, static_cast<std::int64_t>(annotated.citations.size()))
        .Bind(7, static_cast<std::int64_t>(
                     UnresolvedCount(annotated.citations)));
    insert_document.Run();

    const auto entry = forward.find(document.id);
    if (entry == forward.end()) {
      continue;
    }
    insert_citations.Bind(1, document.id)
        .Bind(2, EncodeForwardEntry(entry->second));
    insert_citations.Run();
    for (const auto &target : entry->second.direct_references) {
      insert_edge.Bind(1, document.id).Bind(2, target);
      insert_edge.Run();
    }
  }

  WriteCheckpoint(checkpoint);
  transaction.Commit();
}

void StorageWriter::CommitCheckpoint(const BuildCheckpoint &checkpoint) {
  SqliteTransaction transaction(Database());
  WriteCheckpoint(checkpoint);
  transaction.Commit();
}

CorpusStats StorageWriter::Finalize(const BuildCheckpoint &checkpoint,
                                    const ChainDetector &detector,
                                    const FinalizeOptions &options) {
  auto &database = Database();
  CorpusStats stats;
  stats.corpus_id = corpus_id_;
  stats.skipped_records = checkpoint.skipped_records;
  stats.build_timestamp = options.build_timestamp;
  stats.builder_version = options.builder_version;

  SqliteTransaction transaction(database);
  for (const auto store : {StoreName::kReverseCitations, StoreName::kChains,
                           StoreName::kMetadata}) {
    database.Execute("DELETE FROM \"" + StoreTableName(store) + "\";");
  }

  {
    auto totals = database.Prepare(
        "SELECT COUNT(*), COALESCE(SUM(citation_count), 0), "
        "COALESCE(SUM(unresolved_count), 0), "
        "COALESCE(SUM(citation_count > 0), 0) FROM build_documents;");
    if (totals.Step()) {
      stats.total_documents = static_cast<std::size_t>(totals.ColumnInt64(0));
      stats.total_citations = static_cast<std::size_t>(totals.ColumnInt64(1));
      stats.unresolved_citations =
          static_cast<std::size_t>(totals.ColumnInt64(2));
      stats.documents_with_citations =
          static_cast<std::size_t>(totals.ColumnInt64(3));
    }
    auto dangling = database.Prepare(
        "SELECT COUNT(DISTINCT target) FROM build_edges WHERE target NOT IN "
        "(SELECT id FROM build_documents);");
    if (dangling.Step()) {
      stats.dangling_references =
          static_cast<std::size_t>(dangling.ColumnInt64(0));
    }
  }

  {
    // Inversion: edges ordered by target arrive grouped per cited document.
    auto edges = database.Prepare(
        "SELECT e.target, e.source, d.title, d.url, EXISTS(SELECT 1 FROM "
        "build_documents WHERE id = e.target) FROM build_edges AS e "
        "JOIN build_documents AS d ON d.id = e.source ORDER BY e.target, "
        "e.source;");
    auto insert_reverse =
        database.Prepare(InsertInto(StoreName::kReverseCitations));

    std::string current_target;
    bool current_in_corpus = false;
    std::vector<CitingDetail> citers;
    const auto flush = [&]() {
      if (citers.empty()) {
        return;
      }
      const auto entry =
          GraphAssembler::MakeReverseEntry(current_target, std::move(citers));
      citers.clear();
      insert_reverse.Bind(1, entry.id).Bind(2, EncodeReverseEntry(entry));
      insert_reverse.Run();
      // Dangling targets get a reverse entry but are not corpus documents.
      if (current_in_corpus) {
        ++stats.documents_cited;
      }
      if (entry.cited_by_count > stats.max_references) {
        stats.max_references = entry.cited_by_count;
        stats.most_referenced = entry.id;
      }
    };

    while (edges.Step()) {
      auto target = edges.ColumnText(0);
      if (target != current_target) {
        flush();
        current_target = std::move(target);
        current_in_corpus = edges.ColumnInt64(4) != 0;
      }
      citers.push_back(CitingDetail{edges.ColumnText(1), edges.ColumnText(2),
                                    edges.ColumnText(3)});
    }
    flush();
  }

  {
    std::vector<std::string> roots;
    auto ids = database.Prepare("SELECT id FROM build_documents ORDER BY id;");
    while (ids.Step()) {
      roots.push_back(ids.ColumnText(0));
    }

    const StagedEdgeAdjacency adjacency(database);
    ChainMemberLookup members(database);
    auto insert_chain = database.Prepare(InsertInto(StoreName::kChains));
    for (const auto &root : roots) {
      auto chain = detector.Detect(root, adjacency);
      if (!chain) {
        continue;
      }
      for (const auto &id : chain->chain_sections) {
        chain->complete_chain.push_back(members.Find(id));
      }
      insert_chain.Bind(1, chain->id).Bind(2, EncodeChain(*chain));
      insert_chain.Run();
      ++stats.complex_chains;
    }
  }

  {
    auto insert_metadata = database.Prepare(InsertInto(StoreName::kMetadata));
    insert_metadata.Bind(1, std::string(kCorpusInfoKey))
        .Bind(2, EncodeCorpusStats(stats, AllStoreNames()));
    insert_metadata.Run();
  }

  database.Execute("DROP TABLE build_edges;");
  database.Execute("DROP TABLE build_documents;");
  database.Execute("DROP TABLE build_checkpoint;");
  transaction.Commit();

  database.Execute("VACUUM;");
  database.Close();
  database_.reset();

  std::filesystem::rename(partial_path_, final_path_);
  logger_->Log(LogLevel::kDebug, "storage.finalize",
               {{"path", final_path_.string()},
                {"documents", std::to_string(stats.total_documents)},
                {"chains", std::to_string(stats.complex_chains)}});
  return stats;
}

} // namespace citegraph
