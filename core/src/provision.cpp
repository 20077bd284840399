#include "xstory/provision.h"

#include "xstory/log.h"

namespace xstory {

namespace fs = std::filesystem;

namespace {
bool copy_entry(const fs::path& src, const fs::path& dest, std::string& error) {
  std::error_code ec;
  if (fs::is_directory(src, ec)) {
    // Links inside the tree are followed; the copy holds literal files only.
    fs::copy(src, dest, fs::copy_options::recursive, ec);
    if (ec) {
      error = "copy failed for " + src.string() + ": " + ec.message();
      return false;
    }
    return true;
  }

  fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "copy failed for " + src.string() + ": " + ec.message();
    return false;
  }
  const auto mtime = fs::last_write_time(src, ec);
  if (!ec) {
    fs::last_write_time(dest, mtime, ec);
  }
  if (ec) {
    log::warn("could not preserve modification time for " + dest.string() + ": " + ec.message());
  }
  return true;
}

bool link_entry(const fs::path& src, const fs::path& dest, std::string& error) {
  std::error_code ec;
  const fs::path absolute_src = fs::absolute(src, ec);
  if (ec) {
    error = "cannot resolve " + src.string() + ": " + ec.message();
    return false;
  }
  if (fs::is_directory(absolute_src, ec)) {
    fs::create_directory_symlink(absolute_src, dest, ec);
  } else {
    fs::create_symlink(absolute_src, dest, ec);
  }
  if (ec) {
    error = "symlink failed for " + dest.string() + ": " + ec.message();
    return false;
  }
  return true;
}

InstallSummary install_categories(const std::vector<Category>& list, const InstallContext& ctx, ProvisionMode mode) {
  InstallSummary summary;
  for (const auto& category : list) {
    auto result = install_category(category, ctx, mode);
    for (const auto& entry : result.installed) {
      if (entry.action == InstallAction::Linked) {
        ++summary.linked;
      } else {
        ++summary.copied;
      }
    }
    const bool ok = result.ok;
    summary.categories.push_back(std::move(result));
    if (!ok) {
      summary.ok = false;
      break;
    }
  }
  return summary;
}
} // namespace

std::vector<fs::path> missing_source_dirs(const fs::path& source_root, const SetupConfig& cfg) {
  std::vector<fs::path> missing;
  for (const auto& category : categories()) {
    const fs::path dir = category_source_dir(category, source_root, cfg);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      missing.push_back(dir);
    }
  }
  return missing;
}

bool remove_existing(const fs::path& path, std::string& error) {
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(status)) {
    return true;
  }
  if (fs::is_directory(status)) {
    fs::remove_all(path, ec);
  } else {
    fs::remove(path, ec);
  }
  if (ec) {
    error = "cannot remove " + path.string() + ": " + ec.message();
    return false;
  }
  return true;
}

CategoryInstallResult install_category(const Category& category, const InstallContext& ctx, ProvisionMode mode) {
  CategoryInstallResult result;
  result.category = category.name;

  const fs::path src_dir = category_source_dir(category, ctx.source_root, ctx.config);
  const fs::path dest_dir = category_dest_dir(category, ctx.target_root, ctx.config);
  std::error_code ec;
  if (!fs::is_directory(src_dir, ec)) {
    result.error = "source directory not found: " + src_dir.string();
    log::error(result.error);
    return result;
  }

  fs::create_directories(dest_dir, ec);
  if (ec) {
    result.error = "cannot create " + dest_dir.string() + ": " + ec.message();
    log::error(result.error);
    return result;
  }

  const bool link = mode == ProvisionMode::Symlink && category.symlink_eligible;
  log::info(std::string("installing ") + category.name + (link ? " (symlink)" : " (copy)"));

  for (const auto& name : expected_names(category, ctx.source_root, ctx.config)) {
    const fs::path src = src_dir / name;
    const fs::path dest = dest_dir / name;

    std::string error;
    if (!remove_existing(dest, error) ||
        !(link ? link_entry(src, dest, error) : copy_entry(src, dest, error))) {
      result.error = category.name + "/" + name + ": " + error;
      log::error(result.error);
      return result;
    }

    if (link) {
      log::info("  linked: " + name + " -> " + src.string());
    } else {
      log::info("  copied: " + name);
    }
    result.installed.push_back({name, link ? InstallAction::Linked : InstallAction::Copied});
  }

  result.ok = true;
  return result;
}

InstallSummary install_all(const InstallContext& ctx, ProvisionMode mode) {
  return install_categories(categories(), ctx, mode);
}

InstallSummary sync_always_copy(const InstallContext& ctx) {
  return install_categories(always_copy_categories(), ctx, ProvisionMode::Copy);
}

} // namespace xstory
