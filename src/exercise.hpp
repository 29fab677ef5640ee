#pragma once
/*
 * Exercise
 *
 * Purpose: the ordered curriculum and where each exercise's texts live.
 * Design: IExerciseSource abstracts the origin; ManifestExerciseSource reads
 * <root>/exercises.manifest, InMemoryExerciseSource serves fixed texts.
 * Descriptors are immutable once loaded.
 */
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

struct ExerciseDescriptor {
  std::string id;
  std::filesystem::path path;
  std::string display_name;
  int ordinal = 0;
  std::string hint;
  std::filesystem::path work_dir;
  RunMode mode = RunMode::Check;
  bool lint = false;
};

// Toolchain steps for a default check: the exercise mode, then lint when flagged.
std::vector<RunMode> default_run_steps(const ExerciseDescriptor& ex);

class IExerciseSource {
public:
  virtual ~IExerciseSource() = default;
  virtual const std::vector<ExerciseDescriptor>& exercises() const = 0;
  virtual bool original_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const = 0;
  virtual bool solution_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const = 0;
  size_t size() const { return exercises().size(); }
};

class ManifestExerciseSource : public IExerciseSource {
public:
  static bool load(const std::filesystem::path& root, ManifestExerciseSource& out, std::string& msg);
  // Parses manifest text; relative paths resolve against root.
  static bool parse(const std::string& text, const std::filesystem::path& root,
                    ManifestExerciseSource& out, std::string& msg);

  const std::vector<ExerciseDescriptor>& exercises() const override { return exercises_; }
  bool original_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const override;
  bool solution_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const override;
  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
  std::vector<ExerciseDescriptor> exercises_;
  std::map<std::string, std::filesystem::path> originals_;
  std::map<std::string, std::filesystem::path> solutions_;
};

class InMemoryExerciseSource : public IExerciseSource {
public:
  void add(ExerciseDescriptor ex, std::string original, std::string solution = std::string());
  const std::vector<ExerciseDescriptor>& exercises() const override { return exercises_; }
  bool original_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const override;
  bool solution_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const override;
private:
  std::vector<ExerciseDescriptor> exercises_;
  std::map<std::string, std::string> originals_;
  std::map<std::string, std::string> solutions_;
};
