#include "xstory/categories.h"
#include "xstory/config.h"
#include "xstory/dependents.h"
#include "xstory/environment.h"
#include "xstory/git_config.h"
#include "xstory/health.h"
#include "xstory/log.h"
#include "xstory/paths.h"
#include "xstory/provision.h"
#include "xstory_data/database_init.h"
#include "xstory_data/serialization.h"
#include "xstoryctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out << contents;
  return true;
}

std::string read_text(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

// Minimal bundle: two skills, two commands, one script, one data script,
// one workflow, one action, plus entries that must be ignored.
void build_bundle(const fs::path& root) {
  fs::create_directories(root / "claude" / "skills" / "alpha");
  fs::create_directories(root / "claude" / "skills" / "beta");
  write_text(root / "claude" / "skills" / "alpha" / "SKILL.md", "# alpha\n");
  write_text(root / "claude" / "skills" / "beta" / "SKILL.md", "# beta\n");
  write_text(root / "claude" / "skills" / "README.txt", "not a skill\n");
  write_text(root / "claude" / "commands" / "plan.md", "plan the work\n");
  write_text(root / "claude" / "commands" / "review.md", "review the work\n");
  write_text(root / "claude" / "commands" / "notes.txt", "ignored\n");
  write_text(root / "claude" / "scripts" / "tree.py", "print('tree')\n");
  write_text(root / "claude" / "data" / "migrate.py", "print('migrate')\n");
  write_text(root / "github" / "workflows" / "ci.yml", "name: ci\n");
  write_text(root / "github" / "workflows" / "README.md", "ignored\n");
  fs::create_directories(root / "github" / "actions" / "setup");
  write_text(root / "github" / "actions" / "setup" / "action.yml", "name: setup\n");
}

std::set<std::string> to_set(const std::vector<std::string>& v) {
  return std::set<std::string>(v.begin(), v.end());
}

class FakeGitConfig final : public xstory::GitConfigPort {
 public:
  bool available() const override { return available_; }

  std::optional<std::string> get_local(const std::string& key) override {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
  }

  bool set_local(const std::string& key, const std::string& value, std::string& error) override {
    if (fail_set) {
      error = "config file locked";
      return false;
    }
    values[key] = value;
    ++set_calls;
    return true;
  }

  std::map<std::string, std::string> values;
  bool available_ = true;
  bool fail_set = false;
  int set_calls = 0;
};

} // namespace

int main() {
  xstory::log::init("xstory_tests", fs::path());
  xstory::log::set_console_level(xstory::log::Level::Off);

  int failures = 0;
  const xstory::SetupConfig cfg;

  // Test: mode detection resolution order.
  {
    xstory::EnvironmentSignals env;
    env.platform = xstory::HostPlatform::MacOS;
    if (xstory::detect_mode(true, env) != xstory::ProvisionMode::Copy) {
      std::cerr << "explicit ci flag should force copy\n";
      ++failures;
    }
    if (xstory::detect_mode(false, env) != xstory::ProvisionMode::Symlink) {
      std::cerr << "workstation without signals should symlink\n";
      ++failures;
    }
    env.ci = "TRUE";
    if (xstory::detect_mode(false, env) != xstory::ProvisionMode::Copy) {
      std::cerr << "CI=TRUE should force copy\n";
      ++failures;
    }
    env.ci = "false";
    env.platform = xstory::HostPlatform::Linux;
    if (xstory::detect_mode(false, env) != xstory::ProvisionMode::Copy) {
      std::cerr << "linux without FORCE_SYMLINKS should copy\n";
      ++failures;
    }
    env.force_symlinks = true;
    if (xstory::detect_mode(false, env) != xstory::ProvisionMode::Symlink) {
      std::cerr << "linux with FORCE_SYMLINKS should symlink\n";
      ++failures;
    }
    env.ci = "true";
    if (xstory::detect_mode(false, env) != xstory::ProvisionMode::Copy) {
      std::cerr << "CI signal should win over FORCE_SYMLINKS\n";
      ++failures;
    }
  }

  // Test: category table order and eligibility.
  {
    const auto& cats = xstory::categories();
    const std::vector<std::string> expected_order = {"skills", "commands", "scripts", "data", "workflows", "actions"};
    std::vector<std::string> order;
    for (const auto& c : cats) order.push_back(c.name);
    if (order != expected_order) {
      std::cerr << "category order invalid\n";
      ++failures;
    }
    const auto copy_only = xstory::always_copy_categories();
    if (copy_only.size() != 2 || copy_only[0].name != "workflows" || copy_only[1].name != "actions") {
      std::cerr << "always-copy categories invalid\n";
      ++failures;
    }
    const auto* skills = xstory::find_category("skills");
    if (!skills || !skills->symlink_eligible) {
      std::cerr << "skills should be symlink eligible\n";
      ++failures;
    }
    if (xstory::find_category("nope") != nullptr) {
      std::cerr << "unknown category should not resolve\n";
      ++failures;
    }
  }

  // Test: expected names honour membership rules.
  {
    const fs::path root = fresh_dir("xstory_expected_names");
    build_bundle(root);
    const auto skills = xstory::expected_names(*xstory::find_category("skills"), root, cfg);
    const auto commands = xstory::expected_names(*xstory::find_category("commands"), root, cfg);
    const auto workflows = xstory::expected_names(*xstory::find_category("workflows"), root, cfg);
    if (skills != std::vector<std::string>{"alpha", "beta"}) {
      std::cerr << "skills expected names invalid\n";
      ++failures;
    }
    if (commands != std::vector<std::string>{"plan.md", "review.md"}) {
      std::cerr << "commands expected names invalid\n";
      ++failures;
    }
    if (workflows != std::vector<std::string>{"ci.yml"}) {
      std::cerr << "workflows expected names invalid\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: text placeholder predicate.
  {
    const fs::path root = fresh_dir("xstory_placeholder");
    const fs::path placeholder = root / "C";
    const std::string forty = "../../.source/commands/C.md             ";
    write_text(placeholder, forty);
    if (fs::file_size(placeholder) != 40) {
      std::cerr << "placeholder fixture should be 40 bytes\n";
      ++failures;
    }
    if (!xstory::is_text_placeholder(placeholder, cfg.placeholder)) {
      std::cerr << "relative path text should be a placeholder\n";
      ++failures;
    }
    write_text(root / "story", ".StoryTree/claude/skills/story\n");
    if (!xstory::is_text_placeholder(root / "story", cfg.placeholder)) {
      std::cerr << "submodule path text should be a placeholder\n";
      ++failures;
    }
    write_text(root / "plain.md", "just notes\n");
    if (xstory::is_text_placeholder(root / "plain.md", cfg.placeholder)) {
      std::cerr << "plain text should not be a placeholder\n";
      ++failures;
    }
    write_text(root / "big.md", "../" + std::string(300, 'x'));
    if (xstory::is_text_placeholder(root / "big.md", cfg.placeholder)) {
      std::cerr << "large file should not be a placeholder\n";
      ++failures;
    }
    write_text(root / "binary", std::string("../\0bin", 7));
    if (xstory::is_text_placeholder(root / "binary", cfg.placeholder)) {
      std::cerr << "binary file should not be a placeholder\n";
      ++failures;
    }
    fs::create_directories(root / "dir..");
    if (xstory::is_text_placeholder(root / "dir..", cfg.placeholder)) {
      std::cerr << "directory should not be a placeholder\n";
      ++failures;
    }
    fs::create_symlink("../elsewhere", root / "link");
    if (xstory::is_text_placeholder(root / "link", cfg.placeholder)) {
      std::cerr << "symlink should not be a placeholder\n";
      ++failures;
    }
    xstory::PlaceholderRule tight;
    tight.max_bytes = 10;
    if (xstory::is_text_placeholder(placeholder, tight)) {
      std::cerr << "size threshold should be configurable\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: symlink install is idempotent and links only eligible categories.
  {
    const fs::path source = fresh_dir("xstory_install_src");
    const fs::path target = fresh_dir("xstory_install_dst");
    build_bundle(source);
    const xstory::InstallContext ctx{source, target, cfg};

    const auto first = xstory::install_all(ctx, xstory::ProvisionMode::Symlink);
    const auto report1 = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Symlink);
    const auto second = xstory::install_all(ctx, xstory::ProvisionMode::Symlink);
    const auto report2 = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Symlink);

    if (!first.ok || !second.ok) {
      std::cerr << "symlink install failed\n";
      ++failures;
    }
    if (first.linked != 6 || first.copied != 2) {
      std::cerr << "symlink install counts invalid: " << first.linked << "/" << first.copied << "\n";
      ++failures;
    }
    if (xstory::issue_count(report1) != 0 || xstory::issue_count(report2) != 0) {
      std::cerr << "symlink install should be clean\n";
      ++failures;
    }
    for (size_t i = 0; i < report1.categories.size() && i < report2.categories.size(); ++i) {
      if (report1.categories[i].valid != report2.categories[i].valid) {
        std::cerr << "second install changed valid set for " << report1.categories[i].category << "\n";
        ++failures;
      }
    }

    for (const char* rel : {".claude/skills/alpha", ".claude/skills/beta", ".claude/commands/plan.md",
                            ".claude/commands/review.md", ".claude/scripts/tree.py", ".claude/data/migrate.py"}) {
      if (!fs::is_symlink(target / rel)) {
        std::cerr << "expected symlink: " << rel << "\n";
        ++failures;
      }
    }
    for (const char* rel : {".github/workflows/ci.yml", ".github/actions/setup"}) {
      if (!fs::exists(target / rel) || fs::is_symlink(target / rel)) {
        std::cerr << "expected real copy: " << rel << "\n";
        ++failures;
      }
    }
    if (fs::exists(target / ".claude/commands/notes.txt") || fs::exists(target / ".github/workflows/README.md")) {
      std::cerr << "non-member entries should not be installed\n";
      ++failures;
    }
    const auto* commands = report2.find("commands");
    if (!commands || commands->valid != std::set<std::string>{"plan.md", "review.md"}) {
      std::cerr << "commands should be valid after install\n";
      ++failures;
    }
    const auto verified = xstory::verify(report2);
    if (verified.broken != 0 || verified.valid != 8) {
      std::cerr << "verify counts invalid: " << verified.valid << "/" << verified.broken << "\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: copy install never creates symlinks and replaces stale links.
  {
    const fs::path source = fresh_dir("xstory_copy_src");
    const fs::path target = fresh_dir("xstory_copy_dst");
    build_bundle(source);
    const xstory::InstallContext ctx{source, target, cfg};

    xstory::install_all(ctx, xstory::ProvisionMode::Symlink);
    const auto copied = xstory::install_all(ctx, xstory::ProvisionMode::Copy);
    if (!copied.ok || copied.linked != 0 || copied.copied != 8) {
      std::cerr << "copy install failed or counts invalid\n";
      ++failures;
    }
    for (const auto& entry : fs::recursive_directory_iterator(target)) {
      if (entry.is_symlink()) {
        std::cerr << "copy install left a symlink: " << entry.path().string() << "\n";
        ++failures;
        break;
      }
    }
    if (read_text(target / ".claude/skills/alpha/SKILL.md") != "# alpha\n") {
      std::cerr << "copied skill contents invalid\n";
      ++failures;
    }
    // The earlier symlink pointed into the source; removing it must not
    // have touched the source tree.
    if (!fs::exists(source / "claude/skills/alpha/SKILL.md")) {
      std::cerr << "replacing a directory symlink damaged the source\n";
      ++failures;
    }
    if (fs::last_write_time(target / ".claude/commands/plan.md") !=
        fs::last_write_time(source / "claude/commands/plan.md")) {
      std::cerr << "copied file should keep source mtime\n";
      ++failures;
    }
    const auto report = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Copy);
    if (xstory::issue_count(report) != 0 || xstory::verify(report).valid != 8) {
      std::cerr << "copy install should analyze clean\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: a missing source category fails that category only.
  {
    const fs::path source = fresh_dir("xstory_missing_src");
    const fs::path target = fresh_dir("xstory_missing_dst");
    build_bundle(source);
    fs::remove_all(source / "claude" / "scripts");
    const xstory::InstallContext ctx{source, target, cfg};

    const auto missing = xstory::missing_source_dirs(source, cfg);
    if (missing.size() != 1 || missing.front() != source / "claude" / "scripts") {
      std::cerr << "missing source dirs invalid\n";
      ++failures;
    }
    const auto result = xstory::install_category(*xstory::find_category("scripts"), ctx, xstory::ProvisionMode::Copy);
    if (result.ok || result.error.empty()) {
      std::cerr << "missing source category should fail\n";
      ++failures;
    }
    if (fs::exists(target / ".claude" / "scripts")) {
      std::cerr << "failed category should not create destination\n";
      ++failures;
    }
    const auto summary = xstory::install_all(ctx, xstory::ProvisionMode::Copy);
    if (summary.ok || summary.categories.size() != 3 || summary.categories.back().category != "scripts") {
      std::cerr << "install_all should stop at the failing category\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: valid and dangling skill links.
  {
    const fs::path source = fresh_dir("xstory_dangling_src");
    const fs::path target = fresh_dir("xstory_dangling_dst");
    fs::create_directories(source / "claude" / "skills" / "A");
    fs::create_directories(source / "claude" / "skills" / "B");
    fs::create_directories(target / ".claude" / "skills");
    fs::create_directory_symlink(source / "claude" / "skills" / "A", target / ".claude" / "skills" / "A");
    fs::create_directory_symlink(source / "gone" / "B", target / ".claude" / "skills" / "B");

    const auto report = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Symlink);
    const auto* skills = report.find("skills");
    if (!skills) {
      std::cerr << "skills missing from report\n";
      ++failures;
    } else {
      if (skills->valid != std::set<std::string>{"A"} || skills->broken != std::set<std::string>{"B"}) {
        std::cerr << "dangling link classification invalid\n";
        ++failures;
      }
      if (!skills->missing.empty() || !skills->text_placeholder.empty() || !skills->extra.empty()) {
        std::cerr << "dangling link scenario should have no other states\n";
        ++failures;
      }
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: command checked out as a text placeholder.
  {
    const fs::path source = fresh_dir("xstory_text_src");
    const fs::path target = fresh_dir("xstory_text_dst");
    write_text(source / "claude" / "commands" / "C.md", "command body\n");
    write_text(target / ".claude" / "commands" / "C", "../../.source/commands/C.md             ");

    const auto report = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Symlink);
    const auto* commands = report.find("commands");
    if (!commands || commands->text_placeholder.count("C") != 1) {
      std::cerr << "text placeholder not detected\n";
      ++failures;
    }
    if (commands && commands->missing != std::set<std::string>{"C.md"}) {
      std::cerr << "unlinked command should be missing\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: classification partitions a mixed target.
  {
    const fs::path source = fresh_dir("xstory_mixed_src");
    const fs::path target = fresh_dir("xstory_mixed_dst");
    build_bundle(source);
    write_text(source / "claude" / "commands" / "ship.md", "ship it\n");
    write_text(source / "claude" / "commands" / "local.md", "override me\n");
    const xstory::InstallContext ctx{source, target, cfg};
    xstory::install_category(*xstory::find_category("commands"), ctx, xstory::ProvisionMode::Symlink);

    const fs::path dest = target / ".claude" / "commands";
    fs::remove(dest / "plan.md");
    fs::create_symlink(source / "claude" / "commands" / "removed.md", dest / "plan.md");
    fs::remove(dest / "review.md");
    write_text(dest / "review.md", ".StoryTree/claude/commands/review.md");
    fs::remove(dest / "local.md");
    write_text(dest / "local.md", "a much longer local override that does not reference anything");
    fs::remove(dest / "ship.md");
    write_text(dest / "unrelated.txt", "someone else's file\n");

    const auto report = xstory::analyze(target, source, cfg, xstory::ProvisionMode::Symlink);
    const auto* c = report.find("commands");
    if (!c) {
      std::cerr << "commands missing from mixed report\n";
      ++failures;
    } else {
      if (c->broken != std::set<std::string>{"plan.md"} || c->text_placeholder != std::set<std::string>{"review.md"} ||
          c->extra != std::set<std::string>{"local.md"} || c->missing != std::set<std::string>{"ship.md"} ||
          !c->valid.empty()) {
        std::cerr << "mixed classification invalid\n";
        ++failures;
      }
      std::vector<std::string> all;
      for (const auto* s : {&c->valid, &c->broken, &c->text_placeholder, &c->missing, &c->extra}) {
        all.insert(all.end(), s->begin(), s->end());
      }
      const auto unique = to_set(all);
      if (unique.size() != all.size()) {
        std::cerr << "classification sets overlap\n";
        ++failures;
      }
      for (const auto& name : xstory::expected_names(*xstory::find_category("commands"), source, cfg)) {
        if (unique.count(name) == 0) {
          std::cerr << "expected name unclassified: " << name << "\n";
          ++failures;
        }
      }
      if (unique.count("unrelated.txt") != 0) {
        std::cerr << "unrelated file should be ignored\n";
        ++failures;
      }
      if (c->issues() != 4) {
        std::cerr << "mixed issue count invalid\n";
        ++failures;
      }
    }

    if (report.find("skills") == nullptr || report.find("skills")->missing != std::set<std::string>{"alpha", "beta"}) {
      std::cerr << "absent destination should mark everything missing\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: placeholder cleaning before a symlink install.
  {
    const fs::path source = fresh_dir("xstory_clean_src");
    const fs::path target = fresh_dir("xstory_clean_dst");
    build_bundle(source);
    write_text(target / ".claude" / "skills" / "alpha", "../.StoryTree/claude/skills/alpha");
    write_text(target / ".claude" / "scripts" / "keep.py", "print('mine')\n");
    write_text(target / ".github" / "workflows" / "ci.yml", "../x");

    const size_t cleaned = xstory::clean_text_placeholders(target, cfg);
    if (cleaned != 1 || fs::exists(target / ".claude" / "skills" / "alpha")) {
      std::cerr << "placeholder cleaning invalid: " << cleaned << "\n";
      ++failures;
    }
    if (!fs::exists(target / ".claude" / "scripts" / "keep.py") || !fs::exists(target / ".github" / "workflows" / "ci.yml")) {
      std::cerr << "placeholder cleaning removed too much\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: git reconcile sets missing keys once.
  {
    const fs::path repo = fresh_dir("xstory_git_repo");
    fs::create_directories(repo / ".git");
    FakeGitConfig git;
    git.values[xstory::kGitSubmoduleRecurseKey] = "true";

    const auto first = xstory::reconcile(repo, git);
    if (!first.symlinks_changed || first.recurse_changed || first.skipped) {
      std::cerr << "first reconcile should set core.symlinks only\n";
      ++failures;
    }
    if (git.values[xstory::kGitSymlinksKey] != "true") {
      std::cerr << "core.symlinks not written\n";
      ++failures;
    }
    const auto second = xstory::reconcile(repo, git);
    if (second.symlinks_changed || second.recurse_changed || git.set_calls != 1) {
      std::cerr << "second reconcile should be a no-op\n";
      ++failures;
    }

    git.values[xstory::kGitSymlinksKey] = "false";
    git.values[xstory::kGitSubmoduleRecurseKey] = " TRUE\n";
    const auto third = xstory::reconcile(repo, git);
    if (!third.symlinks_changed || third.recurse_changed) {
      std::cerr << "reconcile should fix false and accept TRUE\n";
      ++failures;
    }

    const auto settings = xstory::inspect_git_settings(repo, git);
    if (settings.size() != 2 || settings[0].status != xstory::SettingStatus::Ok ||
        settings[1].status != xstory::SettingStatus::Ok) {
      std::cerr << "inspected git settings should be ok\n";
      ++failures;
    }

    FakeGitConfig locked;
    locked.fail_set = true;
    const auto failed = xstory::reconcile(repo, locked);
    if (failed.symlinks_changed || failed.recurse_changed || failed.warnings.size() != 2) {
      std::cerr << "failed set should warn without reporting change\n";
      ++failures;
    }
    const auto unset = xstory::inspect_git_settings(repo, locked);
    if (unset.size() != 2 || unset[0].status != xstory::SettingStatus::Warning) {
      std::cerr << "unset git setting should be a warning\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(repo, ec);
  }

  // Test: git reconcile preconditions are warnings.
  {
    const fs::path plain = fresh_dir("xstory_git_plain");
    FakeGitConfig git;
    const auto not_repo = xstory::reconcile(plain, git);
    if (!not_repo.skipped || not_repo.symlinks_changed || git.set_calls != 0 || not_repo.warnings.empty()) {
      std::cerr << "non-repository should be skipped\n";
      ++failures;
    }
    const auto inspected = xstory::inspect_git_settings(plain, git);
    if (inspected.empty() || inspected[0].status != xstory::SettingStatus::Error) {
      std::cerr << "non-repository settings should be errors\n";
      ++failures;
    }

    write_text(plain / ".git", "gitdir: ../.git/modules/plain\n");
    git.available_ = false;
    const auto no_git = xstory::reconcile(plain, git);
    if (!no_git.skipped || no_git.recurse_changed || git.set_calls != 0) {
      std::cerr << "missing git should be skipped\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(plain, ec);
  }

  // Test: dependents registry round-trip.
  {
    const fs::path root = fresh_dir("xstory_registry");
    const fs::path project = root / "projects" / "alpha";
    fs::create_directories(project);
    const fs::path file = root / "dependents.json";

    xstory::DependentsRegistry registry(file);
    std::string error;
    if (!registry.load(error) || !registry.entries().empty()) {
      std::cerr << "missing registry should load empty\n";
      ++failures;
    }
    if (registry.add(project, std::string("Alpha")) != xstory::RegisterOutcome::Registered) {
      std::cerr << "register should add entry\n";
      ++failures;
    }
    if (registry.add(project / ".", std::nullopt) != xstory::RegisterOutcome::AlreadyRegistered ||
        registry.entries().size() != 1) {
      std::cerr << "duplicate register should be a no-op\n";
      ++failures;
    }
    if (!registry.save(error)) {
      std::cerr << "registry save failed: " << error << "\n";
      ++failures;
    }

    const std::string text = read_text(file);
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_array() || doc.size() != 1 || doc[0].value("name", "") != "Alpha" ||
        text.find("\n  {") == std::string::npos) {
      std::cerr << "registry file should be a pretty-printed array\n";
      ++failures;
    }

    xstory::DependentsRegistry reloaded(file);
    if (!reloaded.load(error) || reloaded.entries().size() != 1 ||
        reloaded.entries()[0].path != xstory::normalize_target(project).string()) {
      std::cerr << "registry reload invalid\n";
      ++failures;
    }
    const auto listed = reloaded.list();
    if (listed.size() != 1 || !listed[0].exists || listed[0].entry.name != "Alpha") {
      std::cerr << "registry list invalid\n";
      ++failures;
    }

    const fs::path beta = root / "projects" / "beta";
    reloaded.add(beta, std::nullopt);
    if (reloaded.entries().back().name != "beta" || reloaded.list().back().exists) {
      std::cerr << "default name or liveness invalid\n";
      ++failures;
    }
    if (!reloaded.remove(project) || reloaded.remove(project)) {
      std::cerr << "unregister should remove once\n";
      ++failures;
    }
    for (const auto& entry : reloaded.entries()) {
      if (entry.path == xstory::normalize_target(project).string()) {
        std::cerr << "unregistered path still listed\n";
        ++failures;
      }
    }

    write_text(file, "{\"name\": \"not an array\"}");
    xstory::DependentsRegistry broken(file);
    if (broken.load(error)) {
      std::cerr << "non-array registry should fail to load\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: fan-out isolates a missing dependent.
  {
    const fs::path source = fresh_dir("xstory_fanout_src");
    const fs::path root = fresh_dir("xstory_fanout_targets");
    build_bundle(source);
    const fs::path first = root / "first";
    const fs::path second = root / "second";
    const fs::path third = root / "third";
    fs::create_directories(first);
    fs::create_directories(third);

    xstory::DependentsRegistry registry(root / "dependents.json");
    registry.add(first, std::nullopt);
    registry.add(second, std::nullopt);
    registry.add(third, std::nullopt);

    const auto outcomes = xstory::update_all(registry, source, cfg);
    if (outcomes.size() != 3 || outcomes[0].status != xstory::UpdateStatus::Ok ||
        outcomes[1].status != xstory::UpdateStatus::SkippedNotFound ||
        outcomes[2].status != xstory::UpdateStatus::Ok) {
      std::cerr << "fan-out outcomes invalid\n";
      ++failures;
    }
    for (const auto& dir : {first, third}) {
      if (!fs::is_regular_file(dir / ".github" / "workflows" / "ci.yml") ||
          !fs::is_regular_file(dir / ".github" / "actions" / "setup" / "action.yml")) {
        std::cerr << "fan-out did not copy workflows into " << dir.string() << "\n";
        ++failures;
      }
      if (fs::exists(dir / ".claude")) {
        std::cerr << "fan-out should only touch copy-only categories\n";
        ++failures;
      }
    }
    if (fs::exists(second)) {
      std::cerr << "fan-out should not create missing dependents\n";
      ++failures;
    }

    fs::remove_all(source / "github" / "actions");
    const auto degraded = xstory::update_all(registry, source, cfg);
    if (degraded.size() != 3 || degraded[0].status != xstory::UpdateStatus::Error ||
        degraded[2].status != xstory::UpdateStatus::Error || degraded[0].detail.empty()) {
      std::cerr << "fan-out should report per-dependent errors\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(root, ec);
  }

  // Test: setup config from YAML and JSON.
  {
    const fs::path root = fresh_dir("xstory_config");
    write_text(root / "setup.yaml",
               "setup:\n"
               "  bundle_dir: .agents\n"
               "  registry_file: state/deps.json\n"
               "  placeholder:\n"
               "    max_bytes: 120\n"
               "    markers: [\".Bundle/\"]\n");
    const auto yaml_cfg = xstory::load_setup_config(root / "setup.yaml");
    if (yaml_cfg.bundle_dir != ".agents" || yaml_cfg.ci_dir != ".github" || yaml_cfg.placeholder.max_bytes != 120 ||
        yaml_cfg.placeholder.markers != std::vector<std::string>{".Bundle/"}) {
      std::cerr << "yaml setup config invalid\n";
      ++failures;
    }
    if (xstory::registry_path(root, yaml_cfg) != root / "state" / "deps.json") {
      std::cerr << "registry path should be relative to source root\n";
      ++failures;
    }

    write_text(root / "setup.json", R"({"ci_dir": ".forgejo", "database": {"file": "tree.db"}})");
    const auto json_cfg = xstory::load_setup_config(root / "setup.json");
    if (json_cfg.ci_dir != ".forgejo" || json_cfg.database.file != "tree.db" || json_cfg.bundle_dir != ".claude") {
      std::cerr << "json setup config invalid\n";
      ++failures;
    }

    const auto defaults = xstory::load_setup_config(root / "absent.yaml");
    if (defaults.bundle_dir != ".claude" || defaults.placeholder.max_bytes != 200) {
      std::cerr << "missing setup config should use defaults\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: database initialization from schema and template.
  {
    const fs::path source = fresh_dir("xstory_db_src");
    const fs::path target = fresh_dir("xstory_db_dst");
    xstory::data::write_text_file(source / cfg.database.schema_path,
                                  "CREATE TABLE stories (id INTEGER PRIMARY KEY, title TEXT NOT NULL);\n");

    const auto created = xstory::data::init_database(source, target, cfg, false);
    if (created.status != xstory::data::InitDbStatus::CreatedFromSchema ||
        created.database != target / ".claude" / "data" / "story-tree.db" || !fs::exists(created.database)) {
      std::cerr << "schema database init failed: " << created.error << "\n";
      ++failures;
    }
    const auto skipped = xstory::data::init_database(source, target, cfg, false);
    if (skipped.status != xstory::data::InitDbStatus::Skipped) {
      std::cerr << "existing database should be skipped\n";
      ++failures;
    }

    xstory::data::write_text_file(source / cfg.database.template_path, "template-bytes");
    const auto replaced = xstory::data::init_database(source, target, cfg, true);
    std::string contents;
    if (replaced.status != xstory::data::InitDbStatus::CreatedFromTemplate ||
        !xstory::data::read_text_file(replaced.database, contents) || contents != "template-bytes") {
      std::cerr << "template database init failed\n";
      ++failures;
    }

    const fs::path empty_source = fresh_dir("xstory_db_empty");
    const auto none = xstory::data::init_database(empty_source, target, cfg, true);
    if (none.status != xstory::data::InitDbStatus::Failed || none.error.empty()) {
      std::cerr << "init without template or schema should fail\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
    fs::remove_all(empty_source, ec);
  }

  // Test: remove_existing handles links without following them.
  {
    const fs::path root = fresh_dir("xstory_remove");
    fs::create_directories(root / "real" / "nested");
    write_text(root / "real" / "nested" / "file.txt", "keep");
    fs::create_directory_symlink(root / "real", root / "link");
    std::string error;
    if (!xstory::remove_existing(root / "link", error) || fs::exists(root / "link") ||
        !fs::exists(root / "real" / "nested" / "file.txt")) {
      std::cerr << "removing a directory link should keep its target\n";
      ++failures;
    }
    if (!xstory::remove_existing(root / "real", error) || fs::exists(root / "real")) {
      std::cerr << "directories should be removed recursively\n";
      ++failures;
    }
    if (!xstory::remove_existing(root / "absent", error)) {
      std::cerr << "absent path should not be an error\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: symlink capability probe on this host.
  {
    std::string error;
#if defined(__linux__) || defined(__APPLE__)
    if (!xstory::symlinks_supported(error)) {
      std::cerr << "symlink probe failed: " << error << "\n";
      ++failures;
    }
#else
    (void)xstory::symlinks_supported(error);
#endif
  }

  // Test: placeholders are reported when copies are expected.
  {
    const fs::path source = fresh_dir("xstory_copy_text_src");
    const fs::path target = fresh_dir("xstory_copy_text_dst");
    write_text(source / "claude" / "commands" / "C.md", "command body\n");
    write_text(source / "github" / "workflows" / "ci.yml", "name: ci\n");
    write_text(target / ".claude" / "commands" / "C", "../../.source/commands/C.md             ");
    write_text(target / ".claude" / "commands" / "C.md", "../../.StoryTree/claude/commands/C.md");
    write_text(target / ".github" / "workflows" / "ci.yml", "uses: ../x\n");

    xstory::EnvironmentSignals linux_host;
    linux_host.platform = xstory::HostPlatform::Linux;
    const auto mode = xstory::detect_mode(false, linux_host);
    if (mode != xstory::ProvisionMode::Copy) {
      std::cerr << "linux host should expect copies\n";
      ++failures;
    }
    const auto report = xstory::analyze(target, source, cfg, mode);
    const auto* commands = report.find("commands");
    if (!commands || commands->text_placeholder != std::set<std::string>{"C", "C.md"} || !commands->valid.empty() ||
        !commands->missing.empty()) {
      std::cerr << "copy-mode analysis should report text placeholders\n";
      ++failures;
    }
    const auto* workflows = report.find("workflows");
    if (!workflows || workflows->valid != std::set<std::string>{"ci.yml"} || !workflows->text_placeholder.empty()) {
      std::cerr << "copy-only files are never placeholders\n";
      ++failures;
    }
    if (xstory::issue_count(report) != 2) {
      std::cerr << "copy-mode placeholder issue count invalid\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: copied action directories hold literal files.
  {
    const fs::path source = fresh_dir("xstory_action_link_src");
    const fs::path target = fresh_dir("xstory_action_link_dst");
    build_bundle(source);
    write_text(source / "claude" / "scripts" / "shared.py", "print('shared')\n");
    fs::create_symlink(source / "claude" / "scripts" / "shared.py",
                       source / "github" / "actions" / "setup" / "shared.py");
    const xstory::InstallContext ctx{source, target, cfg};
    const fs::path copied = target / ".github" / "actions" / "setup" / "shared.py";

    for (const auto mode : {xstory::ProvisionMode::Copy, xstory::ProvisionMode::Symlink}) {
      const auto summary = xstory::install_all(ctx, mode);
      if (!summary.ok || fs::is_symlink(copied) || !fs::is_regular_file(copied) ||
          read_text(copied) != "print('shared')\n") {
        std::cerr << "action copy kept a link (" << xstory::mode_name(mode) << ")\n";
        ++failures;
      }
    }
    std::error_code ec;
    fs::remove_all(target, ec);
    fs::create_directories(target);
    const auto synced = xstory::sync_always_copy(ctx);
    if (!synced.ok || fs::is_symlink(copied) || !fs::is_regular_file(copied)) {
      std::cerr << "workflow sync kept a link inside an action\n";
      ++failures;
    }
    fs::remove_all(source, ec);
    fs::remove_all(target, ec);
  }

  // Test: commands reuse the paths resolved at startup.
  {
    const fs::path root = fresh_dir("xstory_cli_paths");
    const auto paths = xstory::resolve_paths(nullptr, root, std::nullopt);
    const int rc = cmd_list_dependents(paths);
    const std::string warning = "bundle sources not found under: " + paths.source_root.string();
    size_t warnings = 0;
    for (const auto& line : xstory::log::recent()) {
      if (line.find(warning) != std::string::npos) ++warnings;
    }
    if (rc != 0 || warnings != 1) {
      std::cerr << "bundle lookup should warn once per command, saw " << warnings << "\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  // Test: log ring buffer keeps the newest events without a log file.
  {
    for (int i = 0; i < 250; ++i) {
      xstory::log::info("ring event " + std::to_string(i));
    }
    const auto lines = xstory::log::recent(1000);
    if (lines.size() != 200 || lines.back().find("[INFO] ring event 249") == std::string::npos) {
      std::cerr << "log ring buffer invalid\n";
      ++failures;
    }
    if (!xstory::log::current_log_file().empty()) {
      std::cerr << "tests should not open a log file\n";
      ++failures;
    }
    if (xstory::log::recent(3).size() != 3) {
      std::cerr << "log recent limit invalid\n";
      ++failures;
    }
  }

  xstory::log::shutdown();
  return failures == 0 ? 0 : 1;
}
