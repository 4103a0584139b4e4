#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "language/language.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace grader;

TEST(LanguageTest, BuiltinProfilesTest) {
    const language_registry &registry = language_registry::builtin();
    ASSERT_EQ(registry.profiles().size(), 4u);

    ASSERT_NE(registry.find_by_extension("sim.py"), nullptr);
    EXPECT_EQ(registry.find_by_extension("sim.py")->id, "python");
    EXPECT_EQ(registry.find_by_extension("src/Main.JAVA")->id, "java");
    EXPECT_EQ(registry.find_by_extension("main.c")->id, "c");
    EXPECT_EQ(registry.find_by_extension("main.cc")->id, "cpp");
    EXPECT_EQ(registry.find_by_extension("main.cxx")->id, "cpp");
    EXPECT_EQ(registry.find_by_extension("README.md"), nullptr);
    EXPECT_EQ(registry.find_by_extension("Makefile"), nullptr);

    const language_profile *python = registry.find_by_id("python");
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->image, "python:3.13");
    EXPECT_TRUE(python->build.empty());
    EXPECT_EQ(registry.find_by_id("java")->build.size(), 1u);
    EXPECT_EQ(registry.find_by_id("cobol"), nullptr);
}

TEST(LanguageTest, MainDetectionTest) {
    const language_registry &registry = language_registry::builtin();
    EXPECT_TRUE(registry.find_by_id("python")->has_main("def run():\n    pass\n\nif __name__ == '__main__':\n    run()\n"));
    EXPECT_FALSE(registry.find_by_id("python")->has_main("def helper():\n    return 1\n"));
    EXPECT_TRUE(registry.find_by_id("java")->has_main("public class Sim {\n  public static void main(String[] args) {}\n}"));
    EXPECT_FALSE(registry.find_by_id("java")->has_main("public class Tape {}"));
    EXPECT_TRUE(registry.find_by_id("c")->has_main("int main(int argc, char **argv) { return 0; }"));
    EXPECT_FALSE(registry.find_by_id("cpp")->has_main("int domain(int x) { return x; }"));
}

TEST(LanguageTest, ExpandCommandTest) {
    map<string, string> vars = {{"code", "/code"}, {"compiled", "/compiled"}, {"entrypoint", "pkg/Sim.java"}, {"entrypoint_stem", "Sim"}};
    EXPECT_EQ(expand_command({"javac", "-d", "{compiled}", "{sources}"}, vars, {"pkg/Sim.java", "pkg/Tape.java"}),
              (vector<string>{"javac", "-d", "/compiled", "pkg/Sim.java", "pkg/Tape.java"}));
    EXPECT_EQ(expand_command({"python3", "{code}/{entrypoint}"}, vars, {}),
              (vector<string>{"python3", "/code/pkg/Sim.java"}));
    EXPECT_EQ(expand_command({"java", "-cp", "{compiled}", "{entrypoint_stem}", "{unknown}"}, vars, {}),
              (vector<string>{"java", "-cp", "/compiled", "Sim", "{unknown}"}));
    // {sources} 只有单独作为一个参数时才展开
    EXPECT_EQ(expand_command({"--files={sources}"}, vars, {"a"}), (vector<string>{"--files={sources}"}));
}

TEST(LanguageTest, LoadRegistryTest) {
    temp_directory dir;
    auto file = dir.write("languages.json", R"([
        {"id": "ruby", "extensions": [".RB"], "image": "ruby:3", "run": ["ruby", "{code}/{entrypoint}"]},
        {"id": "rust", "extensions": [".rs"], "main_pattern": "fn\\s+main", "build": [["rustc", "-o", "{compiled}/main", "{code}/{entrypoint}"]], "run": ["{compiled}/main"]}
    ])");
    language_registry registry = load_language_registry(file);
    ASSERT_EQ(registry.profiles().size(), 2u);
    EXPECT_EQ(registry.find_by_extension("sim.rb")->id, "ruby");
    EXPECT_TRUE(registry.find_by_id("ruby")->has_main("puts 1"));
    EXPECT_TRUE(registry.find_by_id("rust")->has_main("fn main() {}"));
    EXPECT_FALSE(registry.find_by_id("rust")->has_main("fn helper() {}"));
    EXPECT_EQ(registry.find_by_extension("sim.py"), nullptr);
}

TEST(LanguageTest, InvalidRegistryTest) {
    temp_directory dir;
    EXPECT_THROW(load_language_registry(dir.path / "missing.json"), configuration_error);
    EXPECT_THROW(load_language_registry(dir.write("broken.json", "[{")), configuration_error);
    EXPECT_THROW(load_language_registry(dir.write("empty.json", "[]")), configuration_error);
    EXPECT_THROW(load_language_registry(dir.write("norun.json", R"([{"id": "x", "extensions": [".x"]}])")), configuration_error);
    EXPECT_THROW(load_language_registry(dir.write("emptyrun.json", R"([{"id": "x", "extensions": [".x"], "run": []}])")), configuration_error);
    EXPECT_THROW(load_language_registry(dir.write("regex.json", R"([{"id": "x", "extensions": [".x"], "main_pattern": "(", "run": ["x"]}])")), configuration_error);
}
