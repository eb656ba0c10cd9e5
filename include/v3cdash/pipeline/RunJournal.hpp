// Repository: V3CDash
// Component: Run Journal
// Purpose: Per-identity outcomes of one run. Every outcome is appended to a
//          JSONL journal as it happens; the end-of-run report lists which
//          identities were published and which failed, and at which stage.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_PIPELINE_RUN_JOURNAL_HPP_
#define V3CDASH_PIPELINE_RUN_JOURNAL_HPP_

#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "v3cdash/core/PipelineTypes.hpp"

namespace v3cdash::pipeline {

inline constexpr const char* kRunReportFileName = "run_report.json";
inline constexpr const char* kJournalFileName = "outcomes.jsonl";

// C++ mirror of v3cdash.index.v1.IdentityOutcome.
struct IdentityOutcome {
  BitstreamIdentity identity;
  PipelineStage stage = PipelineStage::kEncode;
  bool ok = false;
  PipelineError error = PipelineError::kNone;
  std::string detail;

  // Single-line JSON (one line of JSONL).
  std::string ToJsonLine() const;
  // Returns false if the line is corrupt or incomplete.
  static bool FromJsonLine(const std::string& line, IdentityOutcome& out);
};

class RunJournal {
 public:
  // Opens <dir>/outcomes.jsonl for append, creating dir.
  // Throws std::runtime_error if the journal cannot be opened.
  RunJournal(const std::string& dir, std::string project, GofPlan gof_plan,
             ThreadBudget budget);
  ~RunJournal();

  RunJournal(const RunJournal&) = delete;
  RunJournal& operator=(const RunJournal&) = delete;

  // Thread-safe. A later outcome for the same identity supersedes earlier ones.
  void Record(const IdentityOutcome& outcome);

  void MarkCancelled();
  bool Cancelled() const;

  // Latest outcome per identity, in order of first appearance.
  std::vector<IdentityOutcome> Outcomes() const;
  std::vector<std::string> PublishedIdentities() const;
  std::vector<std::string> FailedIdentities() const;
  bool Degraded() const;

  // Writes the v3cdash.index.v1.RunReport JSON document.
  bool WriteReport(const std::string& path, std::string* error) const;

  const std::string& journal_path() const { return journal_path_; }

  // Reads a journal back; a corrupt trailing line is ignored.
  static std::vector<IdentityOutcome> Replay(const std::string& journal_path);

 private:
  std::string project_;
  GofPlan gof_plan_;
  ThreadBudget budget_;
  std::string journal_path_;

  mutable std::mutex mutex_;
  std::ofstream journal_;
  std::vector<std::string> order_;                   // Guarded by mutex_
  std::map<std::string, IdentityOutcome> latest_;    // Guarded by mutex_
  bool cancelled_ = false;                           // Guarded by mutex_
};

}  // namespace v3cdash::pipeline

#endif  // V3CDASH_PIPELINE_RUN_JOURNAL_HPP_
