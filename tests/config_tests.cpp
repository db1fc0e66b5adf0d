#include "test_common.hpp"
#include <map>
#include "config_utils.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "engine: git\n";
        ofs << "json-log: true\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--engine"] == "git");
    REQUIRE(opts["--json-log"] == "true");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_cat.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "Commit:\n  engine: libgit2\n  lock-suffix: .lck\nLogging:\n  log-level: DEBUG\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--engine"] == "libgit2");
    REQUIRE(opts["--lock-suffix"] == ".lck");
    REQUIRE(opts["--log-level"] == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config categories") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_cat.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"Commit\": {\n    \"engine\": \"git\",\n    \"git-binary\": \"/usr/bin/git\"\n"
               "  },\n  \"Logging\": {\n    \"log-level\": \"DEBUG\"\n  }\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--engine"] == "git");
    REQUIRE(opts["--git-binary"] == "/usr/bin/git");
    REQUIRE(opts["--log-level"] == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML value conversions") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_values.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "bool_true: true\n";
        ofs << "bool_false: false\n";
        ofs << "int_val: 7\n";
        ofs << "float_val: 3.5\n";
        ofs << "null_val: null\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--bool_true"] == "true");
    REQUIRE(opts["--bool_false"] == "false");
    REQUIRE(opts["--int_val"] == "7");
    REQUIRE(opts["--float_val"] == "3.5");
    REQUIRE(opts["--null_val"] == "");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON value conversions") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_values.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"bool_true\": true,\n  \"bool_false\": false,\n  \"int_val\": 7,\n  "
               "\"float_val\": 3.5,\n  \"null_val\": null\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--bool_true"] == "true");
    REQUIRE(opts["--bool_false"] == "false");
    REQUIRE(opts["--int_val"] == "7");
    REQUIRE(opts["--float_val"] == "3.5");
    REQUIRE(opts["--null_val"] == "");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML list value is reported") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_type.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "lock-suffix:\n  - .lock\n  - .lck\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(err.find("lock-suffix") != std::string::npos);
    FS_REMOVE(cfg);
}

TEST_CASE("JSON list value is reported") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_type.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"Logging\": {\n    \"log-level\": [1, 2]\n  }\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(err.find("log-level") != std::string::npos);
    FS_REMOVE(cfg);
}

TEST_CASE("Malformed and missing config files fail") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_bad.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{ \"engine\": ";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(cfg);

    err.clear();
    REQUIRE_FALSE(load_yaml_config((fs::temp_directory_path() / "committer_nope.yaml").string(),
                                   opts, err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("Empty YAML file yields no options") {
    fs::path cfg = fs::temp_directory_path() / "committer_cfg_empty.yaml";
    { std::ofstream ofs(cfg); }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts.empty());
    FS_REMOVE(cfg);
}
