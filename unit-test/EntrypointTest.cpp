#include "gtest/gtest.h"
#include "language/entrypoint.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

static const char *PY_MAIN = "import sys\n\nif __name__ == \"__main__\":\n    print(sys.argv)\n";
static const char *PY_LIB = "def step(state):\n    return state\n";
static const char *C_MAIN = "#include <stdio.h>\nint main(void) { return 0; }\n";

class EntrypointTest : public ::testing::Test {
protected:
    temp_directory dir;
    vector<fs::path> files;

    void add(const string &name, const string &content) {
        dir.write(name, content);
        files.push_back(name);
    }

    resolve_result resolve(const command_override &override = {}) {
        return resolve_entrypoint(language_registry::builtin(), dir.path, files, override);
    }
};

TEST_F(EntrypointTest, NoRecognizedSourcesTest) {
    add("README.md", "# simulator");
    add("notes.txt", "todo");
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<entrypoint_failure>(result));
    EXPECT_EQ(get<entrypoint_failure>(result).kind, verdict_kind::DISCOVERY_FAILURE);
    EXPECT_EQ(get<entrypoint_failure>(result).reason, "no recognized source files");
}

TEST_F(EntrypointTest, SingleSourceTest) {
    add("simulator.py", PY_LIB);
    add("README.md", "");
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    auto &plan = get<execution_plan>(result);
    EXPECT_EQ(plan.language.id, "python");
    EXPECT_EQ(plan.entrypoint, "simulator.py");
    EXPECT_EQ(plan.sources, (vector<fs::path>{"simulator.py"}));
    EXPECT_TRUE(plan.build.empty());
    EXPECT_EQ(plan.run, plan.language.run);
    EXPECT_FALSE(plan.overridden);
}

TEST_F(EntrypointTest, MainMarkerTest) {
    add("tape.py", PY_LIB);
    add("turing.py", PY_MAIN);
    add("util.py", PY_LIB);
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    EXPECT_EQ(get<execution_plan>(result).entrypoint, "turing.py");
    EXPECT_EQ(get<execution_plan>(result).sources.size(), 3u);
}

TEST_F(EntrypointTest, NameHintTest) {
    add("main.c", C_MAIN);
    add("test.c", C_MAIN);
    add("tape.c", "int read_tape(void) { return 0; }\n");
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    auto &plan = get<execution_plan>(result);
    EXPECT_EQ(plan.entrypoint, "main.c");
    EXPECT_EQ(plan.sources, (vector<fs::path>{"main.c", "tape.c", "test.c"}));
    EXPECT_EQ(plan.build, plan.language.build);
}

TEST_F(EntrypointTest, AmbiguousHintTest) {
    add("sim_fast.py", PY_MAIN);
    add("sim_slow.py", PY_MAIN);
    add("bench.py", PY_MAIN);
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<entrypoint_failure>(result));
    auto &failure = get<entrypoint_failure>(result);
    EXPECT_EQ(failure.kind, verdict_kind::AMBIGUOUS_ENTRYPOINT);
    EXPECT_EQ(failure.candidates, (vector<fs::path>{"sim_fast.py", "sim_slow.py"}));
    EXPECT_EQ(failure.reason, "cannot decide between 2 candidate entrypoints: sim_fast.py, sim_slow.py");
}

TEST_F(EntrypointTest, AmbiguousPoolTest) {
    add("b.py", PY_LIB);
    add("a.py", PY_LIB);
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<entrypoint_failure>(result));
    EXPECT_EQ(get<entrypoint_failure>(result).candidates, (vector<fs::path>{"a.py", "b.py"}));
}

TEST_F(EntrypointTest, ExplicitEntrypointTest) {
    add("a.py", PY_LIB);
    add("b.py", PY_LIB);
    command_override override;
    override.entrypoint = fs::path("b.py");
    auto result = resolve(override);
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    EXPECT_EQ(get<execution_plan>(result).entrypoint, "b.py");
    EXPECT_FALSE(get<execution_plan>(result).overridden);
}

TEST_F(EntrypointTest, OverrideCommandsTest) {
    add("a.py", PY_LIB);
    add("b.py", PY_LIB);
    command_override override;
    override.build = "make";
    override.run = "./sim";
    auto result = resolve(override);
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    auto &plan = get<execution_plan>(result);
    EXPECT_EQ(plan.entrypoint, "a.py");
    EXPECT_TRUE(plan.overridden);
    EXPECT_EQ(plan.build, (vector<vector<string>>{{"/bin/sh", "-c", "make"}}));
    EXPECT_EQ(plan.run, (vector<string>{"/bin/sh", "-c", "./sim \"$@\"", "sh"}));
}

TEST_F(EntrypointTest, MixedLanguagesTest) {
    add("src/Simulator.java", "public class Simulator { public static void main(String[] a) {} }");
    add("src/Tape.java", "public class Tape {}");
    add("scripts/plot.py", PY_LIB);
    auto result = resolve();
    ASSERT_TRUE(holds_alternative<execution_plan>(result));
    auto &plan = get<execution_plan>(result);
    EXPECT_EQ(plan.language.id, "java");
    EXPECT_EQ(plan.entrypoint, "src/Simulator.java");
    EXPECT_EQ(plan.sources, (vector<fs::path>{"src/Simulator.java", "src/Tape.java"}));
}
