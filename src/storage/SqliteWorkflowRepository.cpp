#include "storage/SqliteWorkflowRepository.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/TimeUtil.hpp"
#include <sqlite3.h>
#include <mutex>

namespace weft {
namespace storage {

using json = nlohmann::json;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Parse a JSON object column, {} for empty or malformed text
 */
json parseObject(const std::string& text) {
    if (text.empty()) {
        return json::object();
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_WARN("Ignoring malformed JSON column: " + text);
        return json::object();
    }
    return parsed;
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw WeftError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindNull(int index) {
        sqlite3_bind_null(m_stmt, index);
    }

    void bindOptionalText(int index, const std::optional<std::string>& value) {
        if (value) bindText(index, *value); else bindNull(index);
    }

    void bindOptionalInt64(int index, const std::optional<int64_t>& value) {
        if (value) bindInt64(index, *value); else bindNull(index);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;

        std::string message = sqlite3_errmsg(sqlite3_db_handle(m_stmt));
        if ((result & 0xFF) == SQLITE_CONSTRAINT) {
            throw ValidationError("", "Constraint violation: " + message);
        }
        throw WeftError("Step failed: " + message);
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

const char* const kWorkflowColumns =
    "id, uuid, name, description, input_params, is_api, cron_schedule, team_id, "
    "created_at, updated_at";
const char* const kNodeColumns = "id, workflow_id, node_type, metadata, structured_output";
const char* const kEdgeColumns = "id, workflow_id, parent_id, child_id, branch_label";

Workflow readWorkflow(Statement& stmt) {
    Workflow w;
    w.id = stmt.getInt64(0);
    w.uuid = stmt.getText(1);
    w.name = stmt.getText(2);
    w.description = stmt.getText(3);
    w.inputParams = parseObject(stmt.getText(4));
    w.isApi = stmt.getInt64(5) != 0;
    if (!stmt.isNull(6)) w.cronSchedule = stmt.getText(6);
    if (!stmt.isNull(7)) w.teamId = stmt.getInt64(7);
    w.createdAt = stmt.getText(8);
    w.updatedAt = stmt.getText(9);
    return w;
}

Node readNode(Statement& stmt) {
    Node n;
    n.id = stmt.getInt64(0);
    n.workflowId = stmt.getInt64(1);
    std::string type = stmt.getText(2);
    auto kind = workflow::parseNodeKind(type);
    if (!kind) {
        throw WeftError("Stored node " + std::to_string(n.id) + " has unknown type: " + type);
    }
    n.kind = *kind;
    n.metadata = parseObject(stmt.getText(3));
    n.structuredOutput = parseObject(stmt.getText(4));
    return n;
}

Edge readEdge(Statement& stmt) {
    Edge e;
    e.id = stmt.getInt64(0);
    e.workflowId = stmt.getInt64(1);
    e.parentId = stmt.getInt64(2);
    e.childId = stmt.getInt64(3);
    if (!stmt.isNull(4)) e.branchLabel = stmt.getText(4);
    return e;
}

} // anonymous namespace

// =============================================================================
// SqliteWorkflowRepository::Impl
// =============================================================================

class SqliteWorkflowRepository::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) sqlite3_close(m_db);
            m_db = nullptr;
            throw ConfigurationError("Failed to open database " + dbPath + ": " + error);
        }

        // Enable foreign keys
        exec("PRAGMA foreign_keys = ON");

        createTables();
        LOG_INFO("Opened workflow database: " + dbPath);
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw WeftError("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS workflows (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                uuid TEXT UNIQUE NOT NULL,
                name TEXT NOT NULL,
                description TEXT,
                input_params TEXT,
                is_api INTEGER NOT NULL DEFAULT 0,
                cron_schedule TEXT,
                team_id INTEGER,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS nodes (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                workflow_id INTEGER NOT NULL,
                node_type TEXT NOT NULL,
                metadata TEXT NOT NULL,
                structured_output TEXT NOT NULL,
                FOREIGN KEY (workflow_id) REFERENCES workflows(id) ON DELETE CASCADE
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS node_edges (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                workflow_id INTEGER NOT NULL,
                parent_id INTEGER NOT NULL,
                child_id INTEGER NOT NULL,
                branch_label TEXT,
                UNIQUE (parent_id, child_id),
                CHECK (parent_id != child_id),
                FOREIGN KEY (workflow_id) REFERENCES workflows(id) ON DELETE CASCADE,
                FOREIGN KEY (parent_id) REFERENCES nodes(id) ON DELETE CASCADE,
                FOREIGN KEY (child_id) REFERENCES nodes(id) ON DELETE CASCADE
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_nodes_workflow ON nodes(workflow_id)");
        exec("CREATE INDEX IF NOT EXISTS idx_edges_workflow ON node_edges(workflow_id)");
    }

    int64_t lastInsertId() const {
        return sqlite3_last_insert_rowid(m_db);
    }

    int changes() const {
        return sqlite3_changes(m_db);
    }

    std::string m_dbPath;
    sqlite3* m_db;
    mutable std::mutex m_mutex;
};

// =============================================================================
// SqliteWorkflowRepository
// =============================================================================

SqliteWorkflowRepository::SqliteWorkflowRepository(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

SqliteWorkflowRepository::~SqliteWorkflowRepository() = default;

const std::string& SqliteWorkflowRepository::dbPath() const {
    return m_impl->m_dbPath;
}

// === Workflows ===

Workflow SqliteWorkflowRepository::createWorkflow(const Workflow& workflow) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Workflow stored = workflow;
    if (stored.uuid.empty()) {
        stored.uuid = generateUuid();
    }
    stored.createdAt = formatIsoTimestamp(nowMillis());
    stored.updatedAt = stored.createdAt;

    Statement stmt(m_impl->m_db, R"(
        INSERT INTO workflows (uuid, name, description, input_params, is_api,
                               cron_schedule, team_id, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bindText(1, stored.uuid);
    stmt.bindText(2, stored.name);
    stmt.bindText(3, stored.description);
    stmt.bindText(4, stored.inputParams.dump());
    stmt.bindInt64(5, stored.isApi ? 1 : 0);
    stmt.bindOptionalText(6, stored.cronSchedule);
    stmt.bindOptionalInt64(7, stored.teamId);
    stmt.bindText(8, stored.createdAt);
    stmt.bindText(9, stored.updatedAt);
    stmt.step();

    stored.id = m_impl->lastInsertId();
    return stored;
}

Workflow SqliteWorkflowRepository::updateWorkflow(const Workflow& workflow) {
    auto existing = getWorkflow(workflow.id);
    if (!existing) {
        throw NotFoundError("Workflow not found: " + std::to_string(workflow.id));
    }

    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Workflow stored = workflow;
    stored.uuid = existing->uuid;
    stored.createdAt = existing->createdAt;
    stored.updatedAt = formatIsoTimestamp(nowMillis());

    Statement stmt(m_impl->m_db, R"(
        UPDATE workflows
        SET name = ?, description = ?, input_params = ?, is_api = ?,
            cron_schedule = ?, team_id = ?, updated_at = ?
        WHERE id = ?
    )");
    stmt.bindText(1, stored.name);
    stmt.bindText(2, stored.description);
    stmt.bindText(3, stored.inputParams.dump());
    stmt.bindInt64(4, stored.isApi ? 1 : 0);
    stmt.bindOptionalText(5, stored.cronSchedule);
    stmt.bindOptionalInt64(6, stored.teamId);
    stmt.bindText(7, stored.updatedAt);
    stmt.bindInt64(8, stored.id);
    stmt.step();
    return stored;
}

void SqliteWorkflowRepository::deleteWorkflow(int64_t id) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, "DELETE FROM workflows WHERE id = ?");
    stmt.bindInt64(1, id);
    stmt.step();
    if (m_impl->changes() == 0) {
        throw NotFoundError("Workflow not found: " + std::to_string(id));
    }
}

std::optional<Workflow> SqliteWorkflowRepository::getWorkflow(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db,
                   std::string("SELECT ") + kWorkflowColumns + " FROM workflows WHERE id = ?");
    stmt.bindInt64(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readWorkflow(stmt);
}

std::vector<Workflow> SqliteWorkflowRepository::listWorkflows() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db,
                   std::string("SELECT ") + kWorkflowColumns + " FROM workflows ORDER BY id");
    std::vector<Workflow> out;
    while (stmt.step()) {
        out.push_back(readWorkflow(stmt));
    }
    return out;
}

// === Nodes ===

Node SqliteWorkflowRepository::createNode(const Node& node) {
    if (!getWorkflow(node.workflowId)) {
        throw NotFoundError("Workflow not found: " + std::to_string(node.workflowId));
    }

    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, R"(
        INSERT INTO nodes (workflow_id, node_type, metadata, structured_output)
        VALUES (?, ?, ?, ?)
    )");
    stmt.bindInt64(1, node.workflowId);
    stmt.bindText(2, workflow::toString(node.kind));
    stmt.bindText(3, node.metadata.dump());
    stmt.bindText(4, node.structuredOutput.dump());
    stmt.step();

    Node stored = node;
    stored.id = m_impl->lastInsertId();
    return stored;
}

Node SqliteWorkflowRepository::updateNode(const Node& node) {
    auto existing = getNode(node.id);
    if (!existing) {
        throw NotFoundError("Node not found: " + std::to_string(node.id));
    }

    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, R"(
        UPDATE nodes SET node_type = ?, metadata = ?, structured_output = ? WHERE id = ?
    )");
    stmt.bindText(1, workflow::toString(node.kind));
    stmt.bindText(2, node.metadata.dump());
    stmt.bindText(3, node.structuredOutput.dump());
    stmt.bindInt64(4, node.id);
    stmt.step();

    Node stored = node;
    stored.workflowId = existing->workflowId;
    return stored;
}

void SqliteWorkflowRepository::deleteNode(int64_t id) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, "DELETE FROM nodes WHERE id = ?");
    stmt.bindInt64(1, id);
    stmt.step();
    if (m_impl->changes() == 0) {
        throw NotFoundError("Node not found: " + std::to_string(id));
    }
}

std::optional<Node> SqliteWorkflowRepository::getNode(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db,
                   std::string("SELECT ") + kNodeColumns + " FROM nodes WHERE id = ?");
    stmt.bindInt64(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readNode(stmt);
}

std::vector<Node> SqliteWorkflowRepository::listNodes(int64_t workflowId) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, std::string("SELECT ") + kNodeColumns +
                                 " FROM nodes WHERE workflow_id = ? ORDER BY id");
    stmt.bindInt64(1, workflowId);
    std::vector<Node> out;
    while (stmt.step()) {
        out.push_back(readNode(stmt));
    }
    return out;
}

// === Edges ===

Edge SqliteWorkflowRepository::createEdge(const Edge& edge) {
    if (!getWorkflow(edge.workflowId)) {
        throw NotFoundError("Workflow not found: " + std::to_string(edge.workflowId));
    }
    for (int64_t endpoint : {edge.parentId, edge.childId}) {
        auto node = getNode(endpoint);
        if (!node) {
            throw NotFoundError("Node not found: " + std::to_string(endpoint));
        }
        if (node->workflowId != edge.workflowId) {
            throw ValidationError("edge", "node " + std::to_string(endpoint) +
                                          " belongs to another workflow");
        }
    }
    if (edge.parentId == edge.childId) {
        throw ValidationError("edge", "parent_id and child_id must differ");
    }

    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, R"(
        INSERT INTO node_edges (workflow_id, parent_id, child_id, branch_label)
        VALUES (?, ?, ?, ?)
    )");
    stmt.bindInt64(1, edge.workflowId);
    stmt.bindInt64(2, edge.parentId);
    stmt.bindInt64(3, edge.childId);
    stmt.bindOptionalText(4, edge.branchLabel);
    try {
        stmt.step();
    } catch (const ValidationError&) {
        throw ValidationError("edge", "an edge between nodes " + std::to_string(edge.parentId) +
                                      " and " + std::to_string(edge.childId) + " already exists");
    }

    Edge stored = edge;
    stored.id = m_impl->lastInsertId();
    return stored;
}

void SqliteWorkflowRepository::deleteEdge(int64_t id) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, "DELETE FROM node_edges WHERE id = ?");
    stmt.bindInt64(1, id);
    stmt.step();
    if (m_impl->changes() == 0) {
        throw NotFoundError("Edge not found: " + std::to_string(id));
    }
}

std::optional<Edge> SqliteWorkflowRepository::getEdge(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db,
                   std::string("SELECT ") + kEdgeColumns + " FROM node_edges WHERE id = ?");
    stmt.bindInt64(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readEdge(stmt);
}

std::vector<Edge> SqliteWorkflowRepository::listEdges(int64_t workflowId) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    Statement stmt(m_impl->m_db, std::string("SELECT ") + kEdgeColumns +
                                 " FROM node_edges WHERE workflow_id = ? ORDER BY id");
    stmt.bindInt64(1, workflowId);
    std::vector<Edge> out;
    while (stmt.step()) {
        out.push_back(readEdge(stmt));
    }
    return out;
}

} // namespace storage
} // namespace weft
