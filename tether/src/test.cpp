#include <tether/tether.hpp>
#include <tether/rpc/handler.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

using namespace tether;

Config quiet_config() {
    Config c;
    c.quiet = true;
    c.store.base_dir = "mem";
    return c;
}

Task make_task(const std::string& id, const std::string& title, Status status, Timestamp at) {
    Task t;
    t.id = id;
    t.title = title;
    t.status = status;
    t.project = "api";
    t.created = t.updated = at;
    return t;
}

Memory make_memory(const std::string& id, const std::string& content, Timestamp at) {
    Memory m;
    m.id = id;
    m.content = content;
    m.project = "api";
    m.timestamp = at;
    return m;
}

Connection make_edge(const std::string& from, const std::string& to, Timestamp at) {
    Connection c;
    c.from_id = from;
    c.to_id = to;
    c.relevance = 0.5f;
    c.created = c.updated = at;
    return c;
}

bool near(float a, float b) {
    return std::fabs(a - b) < 1e-5f;
}

// ═══════════════════════════════════════════════════════════════════════════
// Types and codec
// ═══════════════════════════════════════════════════════════════════════════

void test_timestamps() {
    std::cout << "Testing timestamps..." << std::endl;

    Timestamp ts = 1773480413589;
    auto back = from_iso8601(to_iso8601(ts));
    assert(back.has_value());
    assert(*back == ts);

    auto day = from_iso8601("2026-03-14");
    auto midnight = from_iso8601("2026-03-14T00:00:00Z");
    assert(day && midnight && *day == *midnight);

    auto spaced = from_iso8601("2026-03-14 09:26:53");
    auto iso = from_iso8601("2026-03-14T09:26:53");
    assert(spaced && iso && *spaced == *iso);

    assert(!from_iso8601("2026-13-01").has_value());
    assert(!from_iso8601("yesterday").has_value());

    std::string id = generate_id(EntityKind::Task, ts);
    assert(id.rfind("task-2026-03-14-", 0) == 0);
    assert(id.size() == std::string("task-2026-03-14-").size() + 8);
    assert(generate_id(EntityKind::Memory, ts).rfind("mem-", 0) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_document_round_trip() {
    std::cout << "Testing document round trip..." << std::endl;

    Timestamp at = 1773480413589;
    Task t = make_task("task-2026-03-14-1a2b3c4d", "Implement JWT auth", Status::InProgress, at);
    t.serial = "API-F0001";
    t.category = "feature";
    t.tags = {"auth", "security"};
    t.description = "line one\n---\nline three\n\\---";
    t.subtasks = {"task-2026-03-14-00000001"};
    Connection c = make_edge(t.id, "mem-2026-03-14-9f8e7d6c", at);
    c.matched_terms = {"JWT"};
    t.connections.push_back(c);
    AutomationRecord rec;
    rec.type = "subtasks";
    rec.confidence = 0.95f;
    rec.timestamp = at;
    rec.details = {{"from", "todo"}};
    t.automation_applied = rec;

    std::string text = render_tasks("api", {t});
    auto doc = parse_document(text);
    assert(doc.errors.empty());
    assert(doc.header.has_value());
    assert(header_compatible(*doc.header));
    assert(doc.blocks.size() == 1);

    Task back = task_from_block(doc.blocks[0]);
    assert(back.id == t.id);
    assert(back.serial == "API-F0001");
    assert(back.status == Status::InProgress);
    assert(back.description == t.description);
    assert(back.tags == t.tags);
    assert(back.subtasks == t.subtasks);
    assert(back.connections.size() == 1);
    assert(back.connections[0].from_id == t.id);
    assert(back.connections[0].matched_terms[0] == "JWT");
    assert(back.created == at);
    assert(back.automation_applied.has_value());
    assert(back.automation_applied->type == "subtasks");

    Memory m = make_memory("mem-2026-03-14-9f8e7d6c", "Chose RS256 over HS256\n---\nfor key rotation", at);
    m.title = "JWT signing";
    m.complexity = 3;
    Memory mback = memory_from_block(parse_document(render_memories("api", {m})).blocks.at(0));
    assert(mback.content == m.content);
    assert(mback.title == "JWT signing");
    assert(mback.complexity == 3);

    // CRLF content: delimiter-like lines stay escaped and the CRs survive
    Memory crlf = make_memory("mem-2026-03-14-0c0d0e0f", "Notes pasted from windows\r\n---\r\nsecond section", at);
    auto crlf_doc = parse_document(render_memories("api", {crlf}));
    assert(crlf_doc.errors.empty());
    assert(crlf_doc.blocks.size() == 1);
    assert(memory_from_block(crlf_doc.blocks[0]).content == crlf.content);

    // A file saved with CRLF line endings still parses
    std::string dos;
    for (char ch : render_tasks("api", {t})) {
        if (ch == '\n') dos += '\r';
        dos += ch;
    }
    auto dos_doc = parse_document(dos);
    assert(dos_doc.header.has_value());
    assert(dos_doc.blocks.size() == 1);
    assert(task_from_block(dos_doc.blocks[0]).id == t.id);

    // Self-loops are dropped on read
    Block b;
    b.fields = task_front_matter(t);
    b.fields["connections"] = json::array({{{"to", t.id}, {"type", "related"}}});
    assert(task_from_block(b).connections.empty());

    std::cout << "  PASS" << std::endl;
}

void test_store_skips_malformed() {
    std::cout << "Testing DocumentStore malformed blocks..." << std::endl;

    auto backend = std::make_shared<MemoryBackend>();
    StoreConfig cfg;
    cfg.base_dir = "base";
    DocumentStore store(backend, cfg, true);

    Timestamp at = now();
    std::string text = render_tasks("api", {make_task("task-good", "Write migration", Status::Todo, at)});
    text += "---\nid: \"task-bad\"\ntitle: {broken\n---\nbody\n";
    backend->mkdir("base/api");
    backend->write("base/api/tasks.md", text);

    LoadResult loaded = store.load_all();
    assert(loaded.tasks.size() == 1);
    assert(loaded.tasks[0].id == "task-good");
    assert(loaded.skipped == 1);
    assert(!loaded.warnings.empty());

    // Rewriting a damaged file keeps a copy of the original first
    size_t writes = backend->writes;
    store.save("api", make_task("task-new", "Write rollback", Status::Todo, at));
    assert(backend->writes == writes + 2);
    assert(store.load_project("api").tasks.size() == 2);

    // Unknown major format is skipped whole
    std::string future = text;
    future.replace(future.find("\"1.0\""), 5, "\"2.0\"");
    backend->mkdir("base/web");
    backend->write("base/web/tasks.md", future);
    LoadResult again = store.load_project("web");
    assert(again.tasks.empty());
    assert(again.skipped >= 1);

    // Hand-edited headers with bare values never abort the load
    std::string bare = render_tasks("ops", {make_task("task-ops", "Rotate credentials", Status::Todo, at)});
    bare.replace(bare.find("\"1.0\""), 5, "1.0");
    backend->mkdir("base/ops");
    backend->write("base/ops/tasks.md", bare);
    std::string odd = render_tasks("misc", {make_task("task-misc", "Sort inbox rules", Status::Todo, at)});
    odd.replace(odd.find("\"tasks\""), 7, "42");
    backend->mkdir("base/misc");
    backend->write("base/misc/tasks.md", odd);

    LoadResult all = store.load_all();
    auto has = [&](const std::string& id) {
        return std::any_of(all.tasks.begin(), all.tasks.end(), [&](const Task& x) { return x.id == id; });
    };
    assert(has("task-ops"));
    assert(has("task-misc"));
    assert(has("task-good"));

    assert(DocumentStore::safe_name("../etc") == ".._etc");
    assert(DocumentStore::safe_name("..") == "_..");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Index and lookup
// ═══════════════════════════════════════════════════════════════════════════

void test_id_resolver() {
    std::cout << "Testing IdResolver..." << std::endl;

    std::vector<std::string> known = {
        "task-2026-03-14-1a2b3c4d",
        "task-2026-03-14-9f8e7d6c",
        "mem-2026-03-14-1a2b3c4d"
    };

    Resolution exact = IdResolver::resolve("task-2026-03-14-1a2b3c4d", known);
    assert(exact.status == ResolveStatus::Exact);

    Resolution cased = IdResolver::resolve(" TASK_2026_03_14_1A2B3C4D ", known);
    assert(cased.status == ResolveStatus::Resolved);
    assert(cased.id == "task-2026-03-14-1a2b3c4d");

    Resolution prefix = IdResolver::resolve("task-2026-03-14-9f", known);
    assert(prefix.found());
    assert(prefix.id == "task-2026-03-14-9f8e7d6c");

    Resolution ambiguous = IdResolver::resolve("task-2026-03-14-", known);
    assert(ambiguous.status == ResolveStatus::Ambiguous);
    assert(ambiguous.suggestions.size() == 2);

    Resolution typo = IdResolver::resolve("task-2026-03-14-1a2b3c4e", known);
    assert(typo.found());
    assert(typo.id == "task-2026-03-14-1a2b3c4d");

    Resolution missing = IdResolver::resolve("nothing-like-this", known);
    assert(!missing.found());

    std::unordered_map<std::string, std::string> serials = {{"api-f0001", "task-2026-03-14-9f8e7d6c"}};
    Resolution serial = IdResolver::resolve("API-F0001", known, serials);
    assert(serial.found());
    assert(serial.id == "task-2026-03-14-9f8e7d6c");

    assert(IdResolver::edit_distance("kitten", "sitting") == 3);

    std::cout << "  PASS" << std::endl;
}

void test_index_filters() {
    std::cout << "Testing Index filters..." << std::endl;

    Index index;
    Task a = make_task("task-a", "Add login form", Status::Todo, 1000);
    a.tags = {"auth"};
    Task b = make_task("task-b", "Hash passwords", Status::InProgress, 2000);
    b.tags = {"auth", "db"};
    b.connections.push_back(make_edge("task-b", "mem-x", 2000));
    Task c = make_task("task-c", "Index sessions table", Status::Todo, 3000);
    c.project = "web";
    c.tags = {"db"};
    Memory m = make_memory("mem-x", "bcrypt cost 12 is the floor", 1500);
    m.tags = {"auth"};
    index.put(a);
    index.put(b);
    index.put(c);
    index.put(m);

    assert(index.task_count() == 3);
    assert(index.memory_count() == 1);
    assert(index.kind_of("mem-x") == EntityKind::Memory);

    ListFilter f;
    f.project = "api";
    auto page = index.list_tasks(f);
    assert(page.total == 2);
    assert(page.items[0].id == "task-b");   // Newest first

    ListFilter tagged;
    tagged.tag = "auth";
    assert(index.list_tasks(tagged).total == 2);
    assert(index.list_memories(tagged).total == 1);

    ListFilter status;
    status.status = Status::InProgress;
    assert(index.list_tasks(status).total == 1);

    ListFilter linked;
    linked.has_memory = true;
    auto with_memory = index.list_tasks(linked);
    assert(with_memory.total == 1);
    assert(with_memory.items[0].id == "task-b");

    ListFilter paged;
    paged.offset = 1;
    paged.limit = 1;
    auto p = index.list_tasks(paged);
    assert(p.total == 3);
    assert(p.items.size() == 1);
    assert(p.items[0].id == "task-b");

    ListFilter since;
    since.since = 2000;
    assert(index.list_tasks(since).total == 2);

    auto incoming = index.incoming("mem-x");
    assert(incoming.size() == 1);
    assert(incoming[0].from_id == "task-b");

    // Freed tag slots are reused without leaking old tags
    assert(index.erase("task-a"));
    assert(!index.erase("task-a"));
    Task d = make_task("task-d", "Style the navbar", Status::Todo, 4000);
    d.tags = {"ui"};
    index.put(d);
    assert(index.list_tasks(tagged).total == 1);
    ListFilter ui;
    ui.tag = "ui";
    assert(index.list_tasks(ui).total == 1);

    std::cout << "  PASS" << std::endl;
}

void test_serials() {
    std::cout << "Testing serial numbers..." << std::endl;

    Index index;
    assert(index.next_serial("api", "feature") == "API-F0001");
    assert(index.next_serial("my project", "") == "MYP-G0001");
    assert(index.next_serial("", "bug") == "TSK-B0001");

    Task t = make_task("task-a", "Add login form", Status::Todo, 1000);
    t.serial = "API-F0001";
    index.put(t);
    assert(index.next_serial("api", "bug") == "API-B0002");

    Resolution r = index.resolve("api_f0001");
    assert(r.found());
    assert(r.id == "task-a");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Ranking and linking
// ═══════════════════════════════════════════════════════════════════════════

void test_text_terms() {
    std::cout << "Testing text terms..." << std::endl;

    auto kw = text::keywords("The JWT middleware validates the token, then the middleware logs");
    assert(std::find(kw.begin(), kw.end(), "middleware") != kw.end());
    assert(std::count(kw.begin(), kw.end(), "middleware") == 1);
    assert(std::find(kw.begin(), kw.end(), "the") == kw.end());
    assert(std::find(kw.begin(), kw.end(), "jwt") == kw.end());   // Too short

    auto tech = text::tech_terms("Moved SessionStore to Redis behind an API gateway");
    assert(std::find(tech.begin(), tech.end(), "SessionStore") != tech.end());
    assert(std::find(tech.begin(), tech.end(), "API") != tech.end());

    auto q = text::quoted("use \"token bucket\" and `rate_limit` with \"a\"");
    assert(q.size() == 2);
    assert(q[0] == "token bucket" && q[1] == "rate_limit");

    tech = text::tech_terms("JWT RefreshToken iPhone snake_case HTTP2 ABc Plain");
    assert(tech.size() == 4);
    assert(tech[0] == "JWT" && tech[1] == "RefreshToken" && tech[2] == "iPhone" && tech[3] == "HTTP2");

    // Long unterminated input is scanned, not recursed over
    std::string huge = "Notes: \"" + std::string(200000, 'a');
    assert(text::quoted(huge).empty());
    assert(text::tech_terms(huge).empty());
    std::regex tail("sample.*task", std::regex::ECMAScript | std::regex::icase);
    assert(!text::regex_search_bounded("sample " + std::string(200000, 'x'), tail));
    assert(text::regex_search_bounded(std::string(5000, 'x') + "\nsample data for the task", tail));
    std::regex anchored("^mock-\\d+");
    assert(text::regex_search_bounded("mock-12 notes", anchored));
    assert(!text::regex_search_bounded("notes\nmock-12", anchored));

    assert(text::contains_term("auth middleware", "auth"));
    assert(!text::contains_term("authentication middleware", "auth"));

    std::cout << "  PASS" << std::endl;
}

void test_ranker_signals() {
    std::cout << "Testing RelevanceRanker signals..." << std::endl;

    Index index;
    RankingWeights w;
    RelevanceRanker ranker(index, w);
    Timestamp at = now();

    Item target;
    target.id = "mem-1";
    target.kind = EntityKind::Memory;
    target.text = "Tuned PostgreSQL connection pool";
    target.project = "api";
    target.timestamp = at;

    Item cand;
    cand.id = "task-1";
    cand.kind = EntityKind::Task;
    cand.text = "Investigate slow queries";
    cand.project = "web";
    cand.timestamp = at - 60 * DAY_MS;
    cand.status = Status::Todo;

    float base = ranker.score(target, cand, STRATEGY_KEYWORD);
    Item same_project = cand;
    same_project.project = "api";
    float s_project = ranker.score(target, same_project, STRATEGY_KEYWORD);
    assert(s_project > base);

    Item with_terms = same_project;
    with_terms.text += " in the postgresql pool";
    std::vector<std::string> matched;
    float s_terms = ranker.score(target, with_terms, STRATEGY_KEYWORD, std::nullopt, &matched);
    assert(s_terms > s_project);
    assert(std::find(matched.begin(), matched.end(), "pool") != matched.end());

    float s_semantic = ranker.score(target, with_terms, STRATEGY_KEYWORD | STRATEGY_SEMANTIC, 0.9f);
    assert(s_semantic > s_terms);

    Item urgent = with_terms;
    urgent.priority = Priority::Urgent;
    assert(ranker.score(target, urgent, STRATEGY_KEYWORD) > s_terms);

    for (float s : {base, s_project, s_terms, s_semantic}) {
        assert(s >= 0.0f && s <= 1.0f);
    }

    // One more shared tag never lowers the score
    Item tagged_target = target;
    tagged_target.tags = {"postgres", "performance"};
    Item one_tag = with_terms;
    one_tag.tags = {"postgres", "ops"};
    Item two_tags = with_terms;
    two_tags.tags = {"postgres", "performance"};
    float s_one = ranker.score(tagged_target, one_tag, STRATEGY_KEYWORD);
    float s_two = ranker.score(tagged_target, two_tags, STRATEGY_KEYWORD);
    assert(s_two >= s_one);
    assert(s_two > s_one || s_two == 1.0f);
    assert(ranker.score(tagged_target, with_terms, STRATEGY_KEYWORD) <= s_one);

    // rank() returns candidates best first
    Task t1 = make_task("task-1", "Investigate slow queries in the postgresql pool", Status::Todo, at);
    Task t2 = make_task("task-2", "Rotate API keys", Status::Todo, at);
    t2.project = "ops";
    index.put(t1);
    index.put(t2);
    RankOptions opts;
    opts.pool = EntityKind::Task;
    auto ranked = ranker.rank(target, opts, at);
    assert(ranked.size() == 2);
    assert(ranked[0].id == "task-1");
    assert(ranked[0].score >= ranked[1].score);

    opts.exclude = {"task-1"};
    ranked = ranker.rank(target, opts, at);
    assert(ranked.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_linker() {
    std::cout << "Testing RelationshipLinker..." << std::endl;

    Index index;
    Config cfg = quiet_config();
    RelevanceRanker ranker(index, cfg.ranking);
    PatternClassifier classifier;
    RelationshipLinker linker(index, ranker, classifier, cfg.linker);
    linker.set_quiet(true);
    Timestamp at = now();

    Task t1 = make_task("task-2026-01-05-aaaa0001", "Implement JWT authentication middleware",
                        Status::InProgress, at);
    t1.category = "auth";
    t1.tags = {"auth", "security"};
    Memory m1 = make_memory("mem-2026-01-05-bbbb0001",
                            "Implemented JWT auth middleware successfully, tests passing", at);
    m1.category = "auth";
    m1.tags = {"auth"};
    Memory m2 = make_memory("mem-2026-01-05-bbbb0002", "Grocery list: apples, oranges", at - 90 * DAY_MS);
    m2.project = "home";
    index.put(t1);
    index.put(m1);
    index.put(m2);

    LinkResult first = linker.link(t1.id, at);
    assert(first.created == 1);
    assert(first.touched.size() == 2);
    const Task* linked = index.find_task(t1.id);
    assert(linked->connections.size() == 1);
    assert(linked->connections[0].to_id == m1.id);
    assert(linked->connections[0].relevance > 0.3f);
    assert(linked->connections[0].relevance <= 1.0f);
    assert(index.find_memory(m1.id)->connections.size() == 1);
    assert(index.find_memory(m2.id)->connections.empty());

    // Unchanged neighbourhood: nothing new, nothing to persist
    LinkResult again = linker.link(t1.id, at);
    assert(again.created == 0);
    assert(again.touched.empty());
    assert(linker.link(m1.id, at).created == 0);
    assert(index.find_task(t1.id)->connections.size() == 1);

    std::set<std::string> touched;
    Connection manual = linker.link_items(m2.id, t1.id, ConnectionType::Implements, "shopping list", touched, at);
    assert(manual.manual);
    assert(manual.type == ConnectionType::Implements);
    assert(near(manual.relevance, 1.0f));
    assert(touched.count(m2.id) == 1);

    bool threw = false;
    try {
        linker.link_items(t1.id, t1.id, ConnectionType::Related, "", touched, at);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "to");
    }
    assert(threw);

    RelatedResult related = linker.related(t1.id, at);
    assert(related.connected.size() == 2);
    assert(related.connected[0].relevance >= related.connected[1].relevance);
    for (const auto& s : related.suggestions) {
        assert(s.id != m1.id && s.id != m2.id);
    }

    ConnectionGraph g = linker.graph("api");
    assert(g.nodes.size() == 2);
    assert(g.edges.size() == 2);

    touched.clear();
    assert(linker.unlink(t1.id, m2.id, touched) == 1);
    assert(linker.unlink(t1.id, m2.id, touched) == 0);

    touched.clear();
    assert(linker.detach(m1.id, touched) == 1);
    assert(index.find_task(t1.id)->connections.empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Automation
// ═══════════════════════════════════════════════════════════════════════════

void test_transitions() {
    std::cout << "Testing status transitions..." << std::endl;

    size_t automatic = 0, manual = 0;
    for (Status from : ALL_STATUSES) {
        assert(!is_legal_transition(from, from));
        assert(!is_legal_transition(from, from, TransitionOrigin::Manual));
        for (Status to : ALL_STATUSES) {
            if (is_legal_transition(from, to)) ++automatic;
            if (is_legal_transition(from, to, TransitionOrigin::Manual)) ++manual;
        }
    }
    assert(automatic == 5);
    assert(manual == 6);
    assert(!is_legal_transition(Status::Todo, Status::Done));
    assert(!is_legal_transition(Status::Done, Status::InProgress));
    assert(is_legal_transition(Status::Done, Status::InProgress, TransitionOrigin::Manual));
    assert(is_legal_transition(Status::Blocked, Status::Todo));

    std::cout << "  PASS" << std::endl;
}

void test_classifier() {
    std::cout << "Testing PatternClassifier..." << std::endl;

    PatternClassifier c;
    StatusIntent done = c.parse_status_intent(
        "Implemented JWT auth middleware successfully, tests passing", Status::InProgress);
    assert(done.suggested_status == Status::Done);
    assert(done.confidence > 0.9f);
    assert(!done.matched_phrase.empty());

    StatusIntent blocked = c.parse_status_intent("Blocked waiting for the vendor API keys", Status::InProgress);
    assert(blocked.suggested_status == Status::Blocked);
    assert(blocked.confidence > 0.6f);

    StatusIntent none = c.parse_status_intent("Lunch with the team", Status::Todo);
    assert(!none.suggested_status.has_value());

    assert(c.has_blocking_marker("Waiting for design sign-off"));
    assert(!c.has_blocking_marker("Migrate billing tables"));
    assert(c.auto_link_type("Research notes on cache eviction") == ConnectionType::Research);
    assert(c.auto_link_type("Fixed the flaky test") == ConnectionType::Related);

    json bad = {{"status_intents", json::array({{{"status", "done"}, {"patterns", {"(["}}}})}};
    bool threw = false;
    try {
        PatternClassifier broken(bad);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "classifier");
    }
    assert(threw);

    // Pattern tables are data: a user table replaces the built-in one
    std::string path = "/tmp/tether_patterns_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"weights": {"pattern": 0.5, "indicator": 0.3, "valid_transition": 0.1},
                   "status_intents": [{"status": "blocked", "patterns": ["\\bparked\\b"], "indicators": ["parked"]}],
                   "blocking_markers": ["parked"],
                   "research_markers": ["spike"]})";
    }
    PatternClassifier custom = PatternClassifier::from_file(path);
    std::filesystem::remove(path);

    StatusIntent parked = custom.parse_status_intent("Work parked until Friday", Status::InProgress);
    assert(parked.suggested_status == Status::Blocked);
    assert(near(parked.confidence, 0.9f));
    assert(!custom.parse_status_intent("Implemented the login flow", Status::InProgress).suggested_status);
    assert(custom.has_blocking_marker("Parked until the vendor replies"));
    assert(custom.auto_link_type("Spike on cache eviction") == ConnectionType::Research);

    threw = false;
    try {
        PatternClassifier::from_file("/nonexistent/patterns.json");
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_automation_rules() {
    std::cout << "Testing AutomationEngine rules..." << std::endl;

    Index index;
    PatternClassifier classifier;
    AutomationConfig cfg;
    AutomationEngine engine(index, classifier, cfg);
    engine.set_quiet(true);
    Timestamp at = now();

    // In-progress parent, every subtask done
    Task p = make_task("task-p", "Ship login flow", Status::InProgress, at);
    Task c1 = make_task("task-c1", "Login form", Status::Done, at);
    Task c2 = make_task("task-c2", "Login endpoint", Status::Done, at);
    p.subtasks = {c1.id, c2.id};
    c1.parent_id = c2.parent_id = p.id;

    // In-progress parent with a blocked subtask
    Task q = make_task("task-q", "Ship billing", Status::InProgress, at);
    Task c3 = make_task("task-c3", "Stripe webhook", Status::Blocked, at);
    q.subtasks = {c3.id};
    c3.parent_id = q.id;

    Task stale = make_task("task-s", "Rewrite search", Status::InProgress, at - 8 * DAY_MS);
    Task urgent = make_task("task-u", "Patch CVE in parser", Status::Todo, at - 4 * DAY_MS);
    urgent.priority = Priority::Urgent;
    Task stuck = make_task("task-l", "Migrate billing tables", Status::Blocked, at - 6 * DAY_MS);

    Task wf = make_task("task-w", "Refactor session cache", Status::InProgress, at);
    wf.category = "code";
    wf.description = "All tests pass and code review complete";

    for (const auto& t : {p, c1, c2, q, c3, stale, urgent, stuck, wf}) index.put(t);

    Evaluation ev = engine.evaluate(p.id, at);
    assert(ev.proposal.has_value());
    assert(ev.proposal->rule == "subtasks");
    assert(ev.proposal->to == Status::Done);
    assert(near(ev.proposal->confidence, 0.95f));
    assert(ev.proposal->created == at);

    Evaluation evq = engine.evaluate(q.id, at);
    assert(evq.proposal && evq.proposal->to == Status::Blocked);
    assert(near(evq.proposal->confidence, 0.7f));

    Evaluation ev3 = engine.evaluate(c3.id, at);
    assert(ev3.proposal && ev3.proposal->rule == "dependency");
    assert(ev3.proposal->to == Status::Todo);
    assert(near(ev3.proposal->confidence, 0.8f));
    assert(ev3.proposal->details["parent_id"] == q.id);

    Evaluation evs = engine.evaluate(stale.id, at);
    assert(!evs.proposal);
    assert(evs.advisories.size() == 1 && evs.advisories[0].type == "stale_task");

    Evaluation evu = engine.evaluate(urgent.id, at);
    assert(evu.advisories.size() == 1 && evu.advisories[0].type == "urgent_task_delay");

    Evaluation evl = engine.evaluate(stuck.id, at);
    assert(!evl.proposal);
    assert(evl.advisories.size() == 1 && evl.advisories[0].type == "long_blocked_task");

    Evaluation evw = engine.evaluate(wf.id, at);
    assert(evw.proposal && evw.proposal->rule == "workflow");
    assert(evw.proposal->to == Status::Done);

    // Linked notes do not feed workflow patterns
    Memory bench = make_memory("mem-bench", "Posted the benchmark results to the wiki", at);
    Task research = make_task("task-r", "Investigate cache eviction", Status::InProgress, at);
    research.category = "research";
    research.connections.push_back(make_edge(research.id, bench.id, at));
    index.put(bench);
    index.put(research);
    assert(!engine.evaluate(research.id, at).proposal);

    // Done is terminal
    assert(!engine.evaluate(c1.id, at).proposal);

    bool threw = false;
    try {
        engine.evaluate("task-missing", at);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    // A throwing rule is recorded and skipped
    engine.insert_rule(0, "explode", [](const Task&, Timestamp) -> RuleOutcome {
        throw std::runtime_error("boom");
    });
    assert(engine.rule_names().front() == "explode");
    assert(engine.rule_names().size() == 6);
    Evaluation noisy = engine.evaluate(p.id, at);
    assert(noisy.errors.size() == 1);
    assert(noisy.proposal && noisy.proposal->rule == "subtasks");

    std::cout << "  PASS" << std::endl;
}

void test_automation_apply() {
    std::cout << "Testing AutomationEngine apply..." << std::endl;

    Index index;
    PatternClassifier classifier;
    AutomationConfig cfg;
    AutomationEngine engine(index, classifier, cfg);
    engine.set_quiet(true);
    Timestamp at = now();

    Task p = make_task("task-p", "Ship login flow", Status::InProgress, at);
    Task c1 = make_task("task-c1", "Login form", Status::Done, at);
    p.subtasks = {c1.id};
    index.put(p);
    index.put(c1);

    std::vector<Task> committed;
    engine.on_commit([&](const Task& t) { committed.push_back(t); });

    Proposal proposal = *engine.evaluate(p.id, at).proposal;

    bool stale = false;
    try {
        engine.prepare(proposal, at + 2 * HOUR_MS);
    } catch (const StaleAutomationError& e) {
        stale = true;
        assert(e.age_ms() == 2 * HOUR_MS);
    }
    assert(stale);
    assert(committed.empty());

    Task updated = engine.apply(proposal, at + 1000);
    assert(updated.status == Status::Done);
    assert(updated.status_reason == proposal.reason);
    assert(updated.automation_applied.has_value());
    assert(updated.automation_applied->type == "subtasks");
    assert(updated.automation_applied->details["from"] == "in_progress");
    assert(committed.size() == 1);
    assert(committed[0].id == p.id);

    Proposal illegal = proposal;
    illegal.task_id = c1.id;
    illegal.to = Status::Blocked;
    bool rejected = false;
    try {
        engine.apply(illegal, at);
    } catch (const InvalidTransitionError& e) {
        rejected = true;
        assert(e.from() == Status::Done);
        assert(e.to() == Status::Blocked);
    }
    assert(rejected);
    assert(committed.size() == 1);

    // Every pair outside the automatic table is refused by apply
    size_t refused = 0;
    for (Status from : ALL_STATUSES) {
        for (Status to : ALL_STATUSES) {
            if (is_legal_transition(from, to, TransitionOrigin::Automatic)) continue;
            index.put(make_task("task-x", "Pair under test", from, at));
            Proposal pair;
            pair.task_id = "task-x";
            pair.from = from;
            pair.to = to;
            pair.rule = "pair";
            pair.created = at;
            bool threw = false;
            try {
                engine.apply(pair, at);
            } catch (const InvalidTransitionError& e) {
                threw = true;
                assert(e.from() == from && e.to() == to);
            }
            assert(threw);
            ++refused;
        }
    }
    assert(refused == 11);
    assert(committed.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_memory_evidence() {
    std::cout << "Testing memory evidence rule..." << std::endl;

    Index index;
    PatternClassifier classifier;
    AutomationConfig cfg;
    AutomationEngine engine(index, classifier, cfg);
    engine.set_quiet(true);
    Timestamp at = now();

    Task t = make_task("task-e", "Implement JWT authentication middleware", Status::Todo, at);
    t.connections.push_back(make_edge(t.id, "mem-e", at));
    Memory m = make_memory("mem-e", "Implemented JWT auth middleware successfully, tests passing", at);
    index.put(t);
    index.put(m);

    Evaluation ev = engine.evaluate(t.id, at);
    assert(ev.proposal.has_value());
    assert(ev.proposal->rule == "memory_evidence");
    assert(ev.proposal->to == Status::Done);
    assert(ev.proposal->details["signals"].size() == 1);

    // todo -> done is proposed but never applied
    AutomationReport report = engine.run_check(at);
    assert(report.evaluated == 1);
    assert(report.proposals.size() == 1);
    assert(report.applied.empty());
    assert(report.rejected.size() == 1);
    assert(index.find_task(t.id)->status == Status::Todo);

    // Evidence outside the window is ignored
    Task old = t;
    old.connections[0].created = old.connections[0].updated = at - 2 * DAY_MS;
    index.put(old);
    assert(!engine.evaluate(t.id, at).proposal);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Deduplication
// ═══════════════════════════════════════════════════════════════════════════

// Fixed similarities keyed by id pair
class FakeSimilarity : public SimilarityProvider {
public:
    std::map<std::pair<std::string, std::string>, float> scores;

    std::vector<SimilarityHit> find_similar(const Item& item, size_t) const override {
        std::vector<SimilarityHit> out;
        for (const auto& [key, score] : scores) {
            if (key.first == item.id) out.push_back({key.second, score});
            if (key.second == item.id) out.push_back({key.first, score});
        }
        return out;
    }
};

void test_dedup_transitive() {
    std::cout << "Testing DeduplicationEngine groups..." << std::endl;

    Index index;
    Config cfg = quiet_config();
    RelevanceRanker ranker(index, cfg.ranking);
    PatternClassifier classifier;
    RelationshipLinker linker(index, ranker, classifier, cfg.linker);
    FakeSimilarity sim;
    sim.scores[{"mem-a", "mem-b"}] = 0.9f;
    sim.scores[{"mem-b", "mem-c"}] = 0.92f;
    sim.scores[{"mem-a", "mem-c"}] = 0.1f;
    DeduplicationEngine dedup(index, ranker, linker, &sim);
    dedup.set_quiet(true);

    Timestamp at = now();
    Memory a = make_memory("mem-a", "Redis cache keys expire after an hour", at - 3000);
    Memory b = make_memory("mem-b", "Cache keys in Redis expire hourly", at - 1000);
    Memory c = make_memory("mem-c", "Redis keys: one hour expiry", at - 2000);
    Memory d = make_memory("mem-d", "Unrelated note on CSS grid", at);
    Task t = make_task("task-t", "Tune cache expiry", Status::Todo, at);
    t.connections.push_back(make_edge(t.id, a.id, at));
    t.connections.push_back(make_edge(t.id, c.id, at));
    a.connections.push_back(make_edge(a.id, t.id, at));
    for (const auto& m : {a, b, c, d}) index.put(m);
    index.put(t);

    DedupReport dry = dedup.run("", 0.85f, true, at);
    assert(dry.scanned == 4);
    assert(dry.groups.size() == 1);
    assert(dry.groups[0].survivor == "mem-b");   // Newest
    assert(dry.groups[0].duplicates.size() == 2);
    assert(dry.removed.empty());
    assert(index.memory_count() == 4);

    // A pair exactly at the threshold stays apart
    DedupReport edge = dedup.run("", 0.9f, true, at);
    assert(edge.groups.size() == 1);
    assert(edge.groups[0].survivor == "mem-b");
    assert(edge.groups[0].duplicates.size() == 1);

    DedupReport real = dedup.run("", 0.85f, false, at);
    assert(real.removed.size() == 2);
    assert(index.memory_count() == 2);
    assert(!index.find_memory("mem-a"));
    assert(!index.find_memory("mem-c"));

    // Both edges collapse onto the survivor
    const Task* task = index.find_task(t.id);
    assert(task->connections.size() == 1);
    assert(task->connections[0].to_id == "mem-b");
    const Memory* survivor = index.find_memory("mem-b");
    assert(survivor->connections.size() == 1);
    assert(survivor->connections[0].to_id == t.id);
    assert(real.touched.count(t.id) == 1);
    assert(real.touched.count("mem-b") == 1);

    // Survivor order: title and summary beat recency
    Memory full = make_memory("mem-full", "x", 1);
    full.title = "t";
    full.summary = "s";
    Memory bare = make_memory("mem-bare", "longer content", 2);
    assert(DeduplicationEngine::better(&full, &bare));
    assert(!DeduplicationEngine::better(&bare, &full));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Service
// ═══════════════════════════════════════════════════════════════════════════

void test_service_validation() {
    std::cout << "Testing Service validation..." << std::endl;

    Service service(quiet_config(), std::make_shared<MemoryBackend>());
    service.open();

    auto rejects = [&](const std::string& title) {
        TaskInput in;
        in.title = title;
        try {
            service.create_task(in);
        } catch (const ValidationError& e) {
            assert(e.field() == "title");
            return true;
        }
        return false;
    };
    assert(rejects(""));
    assert(rejects("   "));
    assert(rejects("abc"));
    assert(rejects("Test task for the demo"));
    assert(rejects("mock-123 login"));
    assert(rejects("Lorem ipsum dolor"));

    MemoryInput mi;
    mi.content = "ok";
    bool threw = false;
    try {
        service.add_memory(mi);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "content");
    }
    assert(threw);

    assert(service.index().size() == 0);

    Config bad = quiet_config();
    bad.validation.placeholder_patterns = {"(unclosed"};
    threw = false;
    try {
        Service broken(bad, std::make_shared<MemoryBackend>());
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_service_tasks() {
    std::cout << "Testing Service tasks..." << std::endl;

    auto backend = std::make_shared<MemoryBackend>();
    Config cfg = quiet_config();
    Service service(cfg, backend);
    service.open();

    TaskInput in;
    in.title = "  Implement JWT authentication middleware ";
    in.project = "api";
    in.category = "feature";
    in.tags = std::vector<std::string>{"auth", "security", "auth"};
    Task parent = service.create_task(in);
    assert(parent.title == "Implement JWT authentication middleware");
    assert(parent.serial == "API-F0001");
    assert(parent.status == Status::Todo);
    assert(parent.tags.size() == 2);
    assert(parent.id.rfind("task-", 0) == 0);

    TaskInput child_in;
    child_in.title = "Write token refresh endpoint";
    child_in.project = "api";
    child_in.parent_id = "api-f0001";
    Task child = service.create_task(child_in);
    assert(child.parent_id == parent.id);
    assert(child.serial == "API-G0002");
    Task reread = service.get_task(parent.id);
    assert(reread.subtasks.size() == 1 && reread.subtasks[0] == child.id);

    // Hierarchy never loops
    TaskInput cycle;
    cycle.parent_id = child.id;
    bool threw = false;
    try {
        service.update_task(parent.id, cycle);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "parent_id");
    }
    assert(threw);

    TaskInput to_done;
    to_done.status = Status::Done;
    threw = false;
    try {
        service.update_task(child.id, to_done);
    } catch (const InvalidTransitionError&) {
        threw = true;
    }
    assert(threw);

    TaskInput start;
    start.status = Status::InProgress;
    assert(service.update_task(child.id, start).status == Status::InProgress);
    assert(service.update_task(child.id, to_done).status == Status::Done);
    assert(service.update_task(child.id, start).status == Status::InProgress);   // Reopen

    // Tolerant lookup
    std::string typo = child.id;
    typo.back() = typo.back() == 'a' ? 'b' : 'a';
    assert(service.get_task(typo).id == child.id);
    threw = false;
    try {
        service.get_memory(child.id);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    auto hits = service.search_tasks("JWT middleware", ListFilter{});
    assert(hits.size() == 1);
    assert(hits[0].task.id == parent.id);
    assert(near(hits[0].score, 1.0f));
    assert(service.search_tasks("nonexistent words", ListFilter{}).empty());

    TaskStats stats = service.task_stats("api");
    assert(stats.total == 2);
    assert(stats.by_status["todo"] == 1);
    assert(stats.by_status["in_progress"] == 1);

    ListFilter paged;
    paged.limit = 1;
    auto page = service.list_tasks(paged);
    assert(page.total == 2);
    assert(page.items.size() == 1);

    // Moving projects rewrites both files
    TaskInput move;
    move.project = "web";
    service.update_task(child.id, move);
    DocumentStore peek(backend, cfg.store, true);
    assert(peek.load_project("api").tasks.size() == 1);
    assert(peek.load_project("web").tasks.size() == 1);

    // Deleting a parent orphans its children
    Task gone = service.delete_task(parent.id);
    assert(gone.id == parent.id);
    assert(service.get_task(child.id).parent_id.empty());
    threw = false;
    try {
        service.get_task(parent.id);
    } catch (const NotFoundError& e) {
        threw = true;
        assert(e.id() == parent.id);
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_service_link_and_automate() {
    std::cout << "Testing Service linking and automation..." << std::endl;

    Service service(quiet_config(), std::make_shared<MemoryBackend>());
    service.open();

    TaskInput in;
    in.title = "Implement JWT authentication middleware";
    in.project = "api";
    in.category = "auth";
    in.tags = std::vector<std::string>{"auth", "security"};
    in.status = Status::InProgress;
    Task t = service.create_task(in);
    assert(t.connections.empty());

    MemoryInput mi;
    mi.content = "Implemented JWT auth middleware successfully, tests passing";
    mi.project = "api";
    mi.category = "auth";
    mi.tags = std::vector<std::string>{"auth"};
    mi.complexity = 9;
    Memory m = service.add_memory(mi);
    assert(m.complexity == 4);
    assert(m.connections.size() == 1);
    assert(m.connections[0].to_id == t.id);

    Task linked = service.get_task(t.id);
    assert(linked.connections.size() == 1);
    assert(linked.connections[0].to_id == m.id);
    assert(linked.connections[0].relevance > 0.3f);

    TaskContext ctx = service.task_context(t.id);
    assert(ctx.memories.size() == 1);
    assert(service.task_stats().with_memories == 1);

    RelatedResult related = service.get_related(m.id);
    assert(related.connected.size() == 1);
    assert(related.connected[0].id == t.id);

    Evaluation ev = service.evaluate_task(t.id);
    assert(ev.proposal && ev.proposal->rule == "memory_evidence");
    assert(ev.proposal->to == Status::Done);

    AutomationReport report = service.run_automation_check();
    assert(report.applied.size() == 1);
    Task done = service.get_task(t.id);
    assert(done.status == Status::Done);
    assert(done.automation_applied && done.automation_applied->type == "memory_evidence");

    Memory read = service.touch_memory(m.id);
    assert(read.access_count == 1);
    assert(read.last_accessed > 0);

    // Manual edges
    MemoryInput note;
    note.content = "Vendor SDK pinned to 4.2 until upstream fix";
    note.project = "vendor";
    Memory n = service.add_memory(note);
    Connection edge = service.link_items(n.id, t.id, "references", "pinned for auth");
    assert(edge.manual);
    assert(edge.type == ConnectionType::References);
    bool threw = false;
    try {
        service.link_items(n.id, t.id, "likes", "");
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "type");
    }
    assert(threw);
    assert(service.unlink_items(n.id, t.id) == 1);
    assert(service.unlink_items(n.id, t.id) == 0);

    // Deleting a memory removes the edges that point at it
    service.delete_memory(m.id);
    assert(service.get_task(t.id).connections.empty());

    std::cout << "  PASS" << std::endl;
}

void test_service_dedup() {
    std::cout << "Testing Service deduplicate..." << std::endl;

    Service service(quiet_config(), std::make_shared<MemoryBackend>());
    service.open();

    MemoryInput mi;
    mi.content = "Configured nginx reverse proxy for the staging cluster";
    mi.project = "ops";
    service.add_memory(mi);
    service.add_memory(mi);
    mi.content = "Rotated the database credentials";
    service.add_memory(mi);

    DedupReport dry = service.deduplicate("ops");
    assert(dry.dry_run);
    assert(dry.groups.size() == 1);
    assert(dry.removed.empty());
    ListFilter ops;
    ops.project = "ops";
    assert(service.list_memories(ops).total == 3);

    DedupReport real = service.deduplicate("ops", std::nullopt, false);
    assert(real.removed.size() == 1);
    assert(service.list_memories(ops).total == 2);

    bool threw = false;
    try {
        service.deduplicate("ops", 1.5f);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "threshold");
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_service_memories() {
    std::cout << "Testing Service memories and graph..." << std::endl;

    Service service(quiet_config(), std::make_shared<MemoryBackend>());
    service.open();

    TaskInput ti;
    ti.title = "Add rate limiting to the public API";
    ti.project = "web";
    Task task = service.create_task(ti);

    MemoryInput mi;
    mi.content = "Sketched a token bucket design for request throttling";
    mi.project = "web";
    Memory note = service.add_memory(mi);

    MemoryInput other;
    other.content = "Renewed the TLS certificates on the mail relay";
    other.project = "ops";
    service.add_memory(other);

    // Large notes go through validation, ranking and linking
    MemoryInput big;
    big.content = "Load test log: \"" + std::string(100000, 'a') + " " + std::string(100000, 'B');
    big.project = "web";
    Memory large = service.add_memory(big);
    assert(service.get_memory(large.id).content.size() == big.content->size());
    service.delete_memory(large.id);

    MemoryInput edit;
    edit.title = "Rate limiter design";
    edit.tags = std::vector<std::string>{"api", "throttling"};
    Memory edited = service.update_memory(note.id, edit);
    assert(edited.title == "Rate limiter design");
    assert(edited.content == note.content);
    assert(edited.tags.size() == 2);
    assert(service.get_memory(note.id).title == "Rate limiter design");

    MemoryInput too_short;
    too_short.content = "ok";
    bool threw = false;
    try {
        service.update_memory(note.id, too_short);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "content");
    }
    assert(threw);

    service.link_items(note.id, task.id, "implements", "Design notes for the limiter");
    ConnectionGraph web = service.connection_graph("web");
    assert(web.nodes.size() == 2);
    bool found = false;
    for (const auto& e : web.edges) {
        assert(e.from_id == note.id || e.from_id == task.id);
        assert(e.to_id == note.id || e.to_id == task.id);
        if (e.from_id == note.id && e.type == ConnectionType::Implements) found = true;
    }
    assert(found);
    assert(service.connection_graph().nodes.size() == 3);

    // Moving a memory rewrites both project files
    MemoryInput move;
    move.project = "ops";
    service.update_memory(note.id, move);
    ListFilter ops;
    ops.project = "ops";
    assert(service.list_memories(ops).total == 2);
    assert(service.connection_graph("web").nodes.size() == 1);

    // Externally computed proposals go through the same guards
    Proposal p;
    p.task_id = task.id;
    p.from = Status::Todo;
    p.to = Status::InProgress;
    p.confidence = 0.9f;
    p.rule = "operator";
    p.reason = "Work picked up";
    p.created = now() - 2 * HOUR_MS;
    threw = false;
    try {
        service.apply_automated_update(p);
    } catch (const StaleAutomationError&) {
        threw = true;
    }
    assert(threw);
    assert(service.get_task(task.id).status == Status::Todo);

    p.created = now();
    Task applied = service.apply_automated_update(p);
    assert(applied.status == Status::InProgress);
    assert(applied.automation_applied && applied.automation_applied->type == "operator");
    Task reread = service.get_task(task.id);
    assert(reread.status == Status::InProgress);
    assert(reread.status_reason == "Work picked up");

    std::cout << "  PASS" << std::endl;
}

void test_service_storage_failure() {
    std::cout << "Testing Service storage failure..." << std::endl;

    auto backend = std::make_shared<MemoryBackend>();
    Service service(quiet_config(), backend);
    service.open();

    TaskInput in;
    in.title = "Add request tracing";
    Task t = service.create_task(in);

    backend->fail_writes = true;
    bool threw = false;
    try {
        TaskInput more;
        more.title = "Add response tracing";
        service.create_task(more);
    } catch (const StorageError& e) {
        threw = true;
        assert(std::string(e.kind()) == "storage");
    }
    assert(threw);
    assert(service.index().task_count() == 1);

    threw = false;
    try {
        TaskInput rename;
        rename.title = "Add distributed tracing";
        service.update_task(t.id, rename);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(service.get_task(t.id).title == "Add request tracing");

    backend->fail_writes = false;
    TaskInput retry;
    retry.title = "Add response tracing";
    service.create_task(retry);
    assert(service.index().task_count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_service_reopen() {
    std::cout << "Testing Service reopen from disk..." << std::endl;

    std::string base = "/tmp/tether_test_" + std::to_string(::getpid());
    std::filesystem::remove_all(base);
    Config cfg = quiet_config();
    cfg.store.base_dir = base;

    std::string task_id, memory_id;
    {
        Service service(cfg);
        assert(service.open() == 0);
        TaskInput in;
        in.title = "Implement JWT authentication middleware";
        in.project = "api";
        in.category = "auth";
        in.description = "Steps:\n---\nsign, verify, rotate";
        task_id = service.create_task(in).id;
        MemoryInput mi;
        mi.content = "JWT middleware: verify signature before expiry";
        mi.project = "api";
        mi.category = "auth";
        memory_id = service.add_memory(mi).id;
    }
    assert(std::filesystem::exists(base + "/api/tasks.md"));
    assert(std::filesystem::exists(base + "/api/memories.md"));

    {
        Service service(cfg);
        assert(service.open() == 2);
        Task t = service.get_task(task_id);
        assert(t.description == "Steps:\n---\nsign, verify, rotate");
        assert(t.connections.size() == 1);
        assert(t.connections[0].to_id == memory_id);
        assert(service.get_memory(memory_id).connections.size() == 1);
    }

    std::filesystem::remove_all(base);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler, RPC and config
// ═══════════════════════════════════════════════════════════════════════════

void test_scheduler() {
    std::cout << "Testing AutomationScheduler..." << std::endl;

    std::atomic<int> calls{0};
    AutomationScheduler scheduler([&calls]() {
        ++calls;
        AutomationReport r;
        r.evaluated = 1;
        return r;
    }, 20, true);

    std::atomic<int> started{0}, stopped{0};
    scheduler.on_event([&](SchedulerEvent e, const std::string&) {
        if (e == SchedulerEvent::Started) ++started;
        if (e == SchedulerEvent::Stopped) ++stopped;
    });

    assert(scheduler.run_once());
    assert(scheduler.stats().ticks == 1);

    scheduler.start();
    assert(scheduler.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    scheduler.stop();
    assert(!scheduler.is_running());
    assert(scheduler.stats().ticks >= 2);
    assert(scheduler.stats().failures == 0);
    assert(started == 1);
    assert(stopped == 1);

    AutomationScheduler failing([]() -> AutomationReport {
        throw StorageError("read", "tasks.md", "disk gone");
    }, 20, true);
    assert(!failing.run_once());
    assert(failing.stats().failures == 1);
    assert(failing.stats().ticks == 0);

    std::cout << "  PASS" << std::endl;
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    Service service(quiet_config(), std::make_shared<MemoryBackend>());
    service.open();
    rpc::Handler handler(&service);

    assert(handler.tools().size() == 20);
    assert(handler.has_tool("create_task"));
    assert(handler.has_tool("deduplicate"));

    auto created = handler.call("create_task", {{"title", "Add rate limiting to login"},
                                                {"project", "web"},
                                                {"tags", "security, api"}});
    assert(!created.is_error);
    std::string id = created.structured["id"].get<std::string>();
    assert(created.structured["tags"].size() == 2);

    auto illegal = handler.call("update_task", {{"id", id}, {"status", "done"}});
    assert(illegal.is_error);
    assert(illegal.structured["error"] == "invalid_transition");
    assert(illegal.structured["from"] == "todo");

    auto unknown_status = handler.call("update_task", {{"id", id}, {"status", "finished"}});
    assert(unknown_status.is_error);
    assert(unknown_status.structured["error"] == "validation");
    assert(unknown_status.structured["field"] == "status");

    auto missing = handler.call("get_task", {{"id", "task-1999-01-01-zzzzzzzz"}});
    assert(missing.is_error);
    assert(missing.structured["error"] == "not_found");

    auto short_title = handler.call("create_task", {{"title", "abc"}});
    assert(short_title.is_error);
    assert(short_title.structured["field"] == "title");

    auto no_args = handler.call("create_task", json::object());
    assert(no_args.is_error);

    auto wrong_type = handler.call("list_tasks", {{"limit", "lots"}});
    assert(wrong_type.is_error);
    assert(wrong_type.structured["error"] == "validation");

    assert(handler.call("frobnicate", json::object()).structured["error"] == "unknown_tool");

    json listed = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    assert(listed["id"] == 1);
    assert(listed["result"]["tools"].size() == 20);

    json called = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"list_tasks","arguments":{"project":"web"}}})"));
    assert(called["result"]["isError"] == false);
    assert(called["result"]["structured"]["total"] == 1);

    json garbage = json::parse(handler.handle("{not json"));
    assert(garbage["error"]["code"] == rpc::error::PARSE_ERROR);

    json no_method = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":3,"method":"reboot"})"));
    assert(no_method["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    json overrides = {
        {"quiet", true},
        {"linker", {{"top_n", 3}, {"threshold", 0.5}}},
        {"automation", {{"interval_ms", 5000}}}
    };
    Config c = Config::from_json(overrides);
    assert(c.quiet);
    assert(c.linker.top_n == 3);
    assert(near(c.linker.threshold, 0.5f));
    assert(c.automation.interval_ms == 5000);
    assert(c.automation.batch_size == 10);
    assert(near(c.ranking.same_project, 0.25f));

    json out_of_range = {{"linker", {{"threshold", 1.5}}}};
    bool threw = false;
    try {
        Config::from_json(out_of_range);
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.field() == "linker.threshold");
    }
    assert(threw);

    threw = false;
    try {
        Config::from_json(json::array());
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Config::load("/nonexistent/tether.json");
    } catch (const StorageError& e) {
        threw = true;
        assert(e.path() == "/nonexistent/tether.json");
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Tether C++ Tests ===" << std::endl;
    std::cout << "Version " << TETHER_VERSION << std::endl;
    std::cout << std::endl;

    test_timestamps();
    test_document_round_trip();
    test_store_skips_malformed();
    test_id_resolver();
    test_index_filters();
    test_serials();

    std::cout << std::endl;
    std::cout << "=== Ranking and Automation ===" << std::endl;
    test_text_terms();
    test_ranker_signals();
    test_linker();
    test_transitions();
    test_classifier();
    test_automation_rules();
    test_automation_apply();
    test_memory_evidence();
    test_dedup_transitive();

    std::cout << std::endl;
    std::cout << "=== Service ===" << std::endl;
    test_service_validation();
    test_service_tasks();
    test_service_link_and_automate();
    test_service_dedup();
    test_service_memories();
    test_service_storage_failure();
    test_service_reopen();
    test_scheduler();
    test_rpc_handler();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
