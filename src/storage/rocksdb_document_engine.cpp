#include "storage/rocksdb_document_engine.hpp"

#include "common/errors.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <charconv>

namespace funtable {

namespace {

constexpr char kSeparator = '\x1f';
constexpr std::size_t kDocIdWidth = 20;

std::string doc_prefix(std::string_view table) {
    std::string prefix{table};
    prefix += kSeparator;
    prefix += 'd';
    prefix += kSeparator;
    return prefix;
}

std::string seq_key(std::string_view table) {
    std::string key{table};
    key += kSeparator;
    key += "seq";
    return key;
}

// Zero-padded so that lexicographic key order equals insertion order.
std::string format_doc_id(uint64_t id) {
    std::string digits = std::to_string(id);
    return std::string(kDocIdWidth - digits.size(), '0') + digits;
}

uint64_t parse_seq(const std::string& raw) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        throw StoreError("Corrupt document id counter: '" + raw + "'");
    }
    return value;
}

void check(const rocksdb::Status& status, const char* op) {
    if (!status.ok()) {
        spdlog::error("RocksDB {} failed: {}", op, status.ToString());
        throw StoreError(std::string("RocksDB ") + op + " failed: " +
                         status.ToString());
    }
}

} // anonymous namespace

RocksDocumentEngine::RocksDocumentEngine(std::filesystem::path db_path)
    : path_(std::move(db_path)) {
    rocksdb::Options options;
    options.create_if_missing = true;

    // Table files are small; keep background work modest.
    options.IncreaseParallelism(2);
    options.OptimizeLevelStyleCompaction();

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, path_.string(), &raw_db);
    if (!status.ok()) {
        throw ConnectionError(
            "Failed to open document file " + path_.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    spdlog::info("Document file opened at {}", path_.string());
}

RocksDocumentEngine::~RocksDocumentEngine() {
    close();
}

void RocksDocumentEngine::close() {
    std::lock_guard lock(mutex_);
    if (db_) {
        spdlog::info("Closing document file {}", path_.string());
        // unique_ptr<rocksdb::DB> destructor calls delete, which closes the DB.
        db_.reset();
    }
}

bool RocksDocumentEngine::is_open() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

void RocksDocumentEngine::ensure_open() const {
    if (!db_) {
        throw TableNotFoundError(
            "Document file " + path_.string() + " is closed or was dropped");
    }
}

void RocksDocumentEngine::scan(
    std::string_view table,
    const std::function<bool(const rocksdb::Slice& key, Document& doc)>& fn) const {
    const std::string prefix = doc_prefix(table);
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        Document doc = Document::parse(it->value().ToString(), nullptr, false);
        if (doc.is_discarded()) {
            throw StoreError("Corrupt document in " + path_.string() +
                             " under key '" + it->key().ToString() + "'");
        }
        if (!fn(it->key(), doc)) {
            return;
        }
    }
    check(it->status(), "Iterate");
}

std::string RocksDocumentEngine::find_first(std::string_view table,
                                            const Query& query,
                                            Document* out) const {
    std::string found;
    scan(table, [&](const rocksdb::Slice& key, Document& doc) {
        if (!query.matches(doc)) {
            return true;
        }
        found = key.ToString();
        if (out != nullptr) {
            *out = std::move(doc);
        }
        return false;
    });
    return found;
}

void RocksDocumentEngine::write_document(std::string_view table,
                                         const std::string& record_key,
                                         const Document& doc) {
    if (!record_key.empty()) {
        check(db_->Put(rocksdb::WriteOptions{}, record_key, doc.dump()), "Put");
        return;
    }

    // New document: bump the per-table counter in the same batch.
    const std::string counter_key = seq_key(table);
    std::string raw;
    auto status = db_->Get(rocksdb::ReadOptions{}, counter_key, &raw);
    uint64_t next_id = 1;
    if (status.ok()) {
        next_id = parse_seq(raw) + 1;
    } else if (!status.IsNotFound()) {
        check(status, "Get");
    }

    rocksdb::WriteBatch batch;
    batch.Put(doc_prefix(table) + format_doc_id(next_id), doc.dump());
    batch.Put(counter_key, std::to_string(next_id));
    check(db_->Write(rocksdb::WriteOptions{}, &batch), "Write");
}

void RocksDocumentEngine::upsert(std::string_view table, const Document& doc,
                                 const Query& query) {
    if (!doc.is_object()) {
        throw ValueTypeError("Document must be a JSON object");
    }
    std::lock_guard lock(mutex_);
    ensure_open();

    Document existing;
    const std::string record_key = find_first(table, query, &existing);
    if (record_key.empty()) {
        write_document(table, record_key, doc);
        return;
    }
    for (const auto& [field, value] : doc.items()) {
        existing[field] = value;
    }
    write_document(table, record_key, existing);
}

Document RocksDocumentEngine::update_or_insert(std::string_view table,
                                               const Query& query,
                                               const Updater& updater) {
    std::lock_guard lock(mutex_);
    ensure_open();

    Document existing;
    const std::string record_key = find_first(table, query, &existing);
    std::optional<Document> current;
    if (!record_key.empty()) {
        current = std::move(existing);
    }

    Document next = updater(current);
    if (!next.is_object()) {
        throw ValueTypeError("Document must be a JSON object");
    }
    write_document(table, record_key, next);
    return next;
}

std::optional<Document> RocksDocumentEngine::get(std::string_view table,
                                                 const Query& query) const {
    std::lock_guard lock(mutex_);
    ensure_open();

    Document doc;
    if (find_first(table, query, &doc).empty()) {
        return std::nullopt;
    }
    return doc;
}

std::size_t RocksDocumentEngine::remove(std::string_view table,
                                        const Query& query) {
    std::lock_guard lock(mutex_);
    ensure_open();

    rocksdb::WriteBatch batch;
    std::size_t count = 0;
    scan(table, [&](const rocksdb::Slice& key, Document& doc) {
        if (query.matches(doc)) {
            batch.Delete(key);
            ++count;
        }
        return true;
    });
    if (count > 0) {
        check(db_->Write(rocksdb::WriteOptions{}, &batch), "Write");
    }
    return count;
}

std::vector<Document> RocksDocumentEngine::all(std::string_view table) const {
    return search(table, Query{});
}

std::vector<Document> RocksDocumentEngine::search(std::string_view table,
                                                  const Query& query) const {
    std::lock_guard lock(mutex_);
    ensure_open();

    std::vector<Document> result;
    scan(table, [&](const rocksdb::Slice&, Document& doc) {
        if (query.matches(doc)) {
            result.push_back(std::move(doc));
        }
        return true;
    });
    return result;
}

} // namespace funtable
