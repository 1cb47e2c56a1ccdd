/*
 * dailies C++17 - Command-line driver tests
 */
#include <dailies/core/application.hpp>
#include <dailies/core/utils.hpp>
#include <dailies/chat/conversation.hpp>
#include <dailies/org/builder.hpp>
#include <dailies/org/document_parser.hpp>

#include <cassert>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace dailies;

namespace {

struct Outcome {
    bool started;
    int code;
    std::string out;
};

// Runs the driver the way main() does, capturing stdout
Outcome Run(const std::vector<std::string>& args) {
    std::vector<std::string> storage;
    storage.push_back("dailies-org");
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (size_t i = 0; i < storage.size(); ++i) {
        argv.push_back(&storage[i][0]);
    }
    argv.push_back(nullptr);

    std::ostringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());

    Application& app = Application::instance();
    Outcome outcome;
    outcome.started = app.init(static_cast<int>(storage.size()), argv.data());
    outcome.code = outcome.started ? app.run() : app.exit_code();
    if (outcome.started) app.shutdown();

    std::cout.rdbuf(saved);
    outcome.out = captured.str();
    return outcome;
}

std::string TempDir(const char* name) {
    std::string dir = "/tmp/dailies_app_" + std::string(name) + "_" + std::to_string(getpid());
    bool ok = create_directories(dir);
    assert(ok);
    return dir;
}

void WriteOrDie(const std::string& path, const std::string& content) {
    std::string error;
    bool ok = write_file(path, content, error);
    assert(ok);
}

std::string ReadOrDie(const std::string& path) {
    std::string text;
    std::string error;
    bool ok = read_file(path, text, error);
    assert(ok);
    return text;
}

std::vector<Conversation> SampleConversations() {
    Conversation c;
    c.topic = "Trip";
    c.messages.push_back(Message(MessageRole::USER, "Where should we go?"));
    c.messages.push_back(Message(MessageRole::ASSISTANT, "Lisbon."));
    return std::vector<Conversation>(1, c);
}

} // namespace

void TestUsageErrors() {
    Outcome none = Run(std::vector<std::string>());
    assert(!none.started);
    assert(none.code == 2);

    Outcome version = Run({"--version"});
    assert(!version.started);
    assert(version.code == 0);
    assert(version.out.find("dailies-org v") != std::string::npos);

    Outcome help = Run({"--help"});
    assert(!help.started);
    assert(help.code == 0);
    assert(help.out.find("Usage:") != std::string::npos);

    Outcome dangling = Run({"--config"});
    assert(!dangling.started);
    assert(dangling.code == 2);

    Outcome unknown = Run({"frobnicate"});
    assert(unknown.started);
    assert(unknown.code == 2);

    assert(Run({"parse"}).code == 2);
    assert(Run({"parse", "a.org", "b.org"}).code == 2);
    assert(Run({"build"}).code == 2);
    assert(Run({"import", "a.csv", "out", "extra"}).code == 2);
}

void TestConfigFile() {
    const std::string dir = TempDir("config");
    const std::string missing = join_path(dir, "missing.json");
    Outcome failed = Run({"--config", missing, "parse", "x.org"});
    assert(!failed.started);
    assert(failed.code == 1);

    const std::string config = join_path(dir, "config.json");
    WriteOrDie(config, "{\"log_level\": \"error\", \"builder\": {\"max_iterations\": 4}}");
    const std::string json = join_path(dir, "in.json");
    WriteOrDie(json, to_json(SampleConversations()).dump());

    Outcome built = Run({"-c", config, "build", json});
    assert(built.started);
    assert(built.code == 0);
    assert(Application::instance().config().get_int("builder.max_iterations") == 4);

    // A later command line without --config falls back to defaults
    Outcome plain = Run({"build", json});
    assert(plain.code == 0);
    assert(!Application::instance().config().has("builder.max_iterations"));

    std::remove(config.c_str());
    std::remove(json.c_str());
    rmdir(dir.c_str());
}

void TestParseCommand() {
    const std::string dir = TempDir("parse");
    const std::string good = join_path(dir, "2024-03-15.org");
    const std::string bad = join_path(dir, "2024-03-16.org");
    WriteOrDie(good, build_org_document(SampleConversations()).document);
    WriteOrDie(bad, "\xC3\x28 broken\n");

    Outcome single = Run({"parse", good});
    assert(single.code == 0);
    Json doc = Json::parse(single.out, nullptr, false);
    assert(!doc.is_discarded());
    assert(doc.is_object());
    assert(doc["conversations"].size() == 1);
    assert(doc["conversations"][0]["date"] == "2024-03-15");
    assert(doc["conversations"][0]["messages"][1]["content"] == "Lisbon.");
    assert(doc["failures"].is_array());
    assert(doc["failures"].empty());

    // A bad file in a directory is reported, not fatal
    Outcome batch = Run({"parse", dir});
    assert(batch.code == 0);
    doc = Json::parse(batch.out, nullptr, false);
    assert(doc["conversations"].size() == 1);
    assert(doc["failures"].size() == 1);
    assert(doc["failures"][0]["path"] == bad);

    Outcome broken = Run({"parse", bad});
    assert(broken.code == 1);
    doc = Json::parse(broken.out, nullptr, false);
    assert(doc["conversations"].is_array());
    assert(doc["conversations"].empty());
    assert(doc["failures"].size() == 1);

    assert(Run({"parse", join_path(dir, "absent")}).code == 1);

    std::remove(good.c_str());
    std::remove(bad.c_str());
    rmdir(dir.c_str());
}

void TestBuildCommand() {
    const std::string dir = TempDir("build");
    const std::string org = join_path(dir, "out.org");

    // The object printed by `parse`
    Json wrapped;
    wrapped["conversations"] = to_json(SampleConversations());
    wrapped["failures"] = Json::array();
    const std::string object_json = join_path(dir, "object.json");
    WriteOrDie(object_json, wrapped.dump(2));

    assert(Run({"build", object_json, org}).code == 0);
    std::vector<Conversation> back = parse_org_document(ReadOrDie(org), org);
    assert(back.size() == 1);
    assert(back[0].topic == "Trip");
    assert(back[0].messages[1].content == "Lisbon.");

    // A bare array, written to stdout
    const std::string array_json = join_path(dir, "array.json");
    WriteOrDie(array_json, to_json(SampleConversations()).dump());
    Outcome to_stdout = Run({"build", array_json});
    assert(to_stdout.code == 0);
    assert(to_stdout.out == ReadOrDie(org));
    assert(Run({"build", array_json, "-"}).out == to_stdout.out);

    const std::string invalid = join_path(dir, "invalid.json");
    WriteOrDie(invalid, "{not json");
    assert(Run({"build", invalid}).code == 1);

    const std::string scalar = join_path(dir, "scalar.json");
    WriteOrDie(scalar, "{\"conversations\": 3}");
    assert(Run({"build", scalar}).code == 1);

    const std::string no_list = join_path(dir, "no_list.json");
    WriteOrDie(no_list, "{\"topic\": \"x\"}");
    assert(Run({"build", no_list}).code == 1);

    const std::string bad_message = join_path(dir, "bad_message.json");
    WriteOrDie(bad_message, "[{\"messages\": [{\"role\": \"user\"}]}]");
    assert(Run({"build", bad_message}).code == 1);

    assert(Run({"build", join_path(dir, "absent.json")}).code == 1);

    const char* files[] = { "out.org", "object.json", "array.json", "invalid.json",
                            "scalar.json", "no_list.json", "bad_message.json" };
    for (size_t i = 0; i < sizeof(files) / sizeof(files[0]); ++i) {
        std::remove(join_path(dir, files[i]).c_str());
    }
    rmdir(dir.c_str());
}

void TestImportCommand() {
    const std::string dir = TempDir("import");
    const std::string csv = join_path(dir, "history.csv");
    const std::string out_dir = join_path(dir, "daily");
    WriteOrDie(csv,
               "Date,Conversation\n"
               "\"1/8/25, 10:16 PM\",\"Question:\nLate\nAI Response:\nNight\"\n"
               "\"1/9/25, 9:00 AM\",\"Question:\nSecond day\nAI Response:\nOk\"\n");

    assert(Run({"import", csv, out_dir}).code == 0);
    const std::string first = join_path(out_dir, "2025-01-08.org");
    const std::string second = join_path(out_dir, "2025-01-09.org");
    std::vector<Conversation> convs = parse_org_document(ReadOrDie(first), first);
    assert(convs.size() == 1);
    assert(convs[0].topic == "Late");
    assert(convs[0].messages[1].content == "Night");
    assert(parse_org_document(ReadOrDie(second), second)[0].topic == "Second day");

    const std::string bad = join_path(dir, "bad.csv");
    WriteOrDie(bad, "When,Text\nx,y\n");
    assert(Run({"import", bad, out_dir}).code == 1);
    assert(Run({"import", join_path(dir, "absent.csv"), out_dir}).code == 1);

    std::remove(first.c_str());
    std::remove(second.c_str());
    rmdir(out_dir.c_str());
    std::remove(csv.c_str());
    std::remove(bad.c_str());
    rmdir(dir.c_str());
}

int main() {
    TestUsageErrors();
    TestConfigFile();
    TestParseCommand();
    TestBuildCommand();
    TestImportCommand();
    return 0;
}
