#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/config.hpp"
#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/row_ops.hpp"

namespace rref_core {

enum class StepKind : std::uint8_t {
		PivotSearch,
		NoPivotInColumn,
		PivotFound,
		SwapPerformed,
		ScaleNeeded,
		ScalePerformed,
		PivotAlreadyOne,
		EliminationStart,
		EliminationRow,
		EliminationRowDone,
		ColumnComplete,
		Complete,
		ContradictionFound,
		NoSolution,
		SolutionSummary, // pivot / variable counts, precedes the verdict
		UniqueSolution,
		InfiniteSolutions,
		AnalysisComplete,
		NotApplicable,
};

const char* step_kind_name(StepKind kind) noexcept;

// next unprocessed pivot position (0 based)
struct PivotCursor {
		std::uint8_t row = 0;
		std::uint8_t col = 0;
};

enum class RunState : std::uint8_t {
		NotStarted,
		InProgress,
		Finished,
};

enum class SolutionKind : std::uint8_t {
		Unknown, // analysis not reached yet
		NoSolution,
		Unique,
		Infinite,
		NotApplicable, // single column matrix
};

struct Classification {
		SolutionKind kind = SolutionKind::Unknown;
		std::uint8_t pivots = 0;
		std::uint8_t variables = 0;
		std::uint8_t free_variables = 0;
		std::uint8_t contradiction_row = 0; // valid when kind == NoSolution
};

// one emitted step. the side effect (if any) is already applied when the
// caller sees it.
//
// field use by kind:
//   cursor        all kinds, cursor at emission time
//   row           PivotFound/SwapPerformed: pivot row found by the search
//                 EliminationRow/EliminationRowDone: row being eliminated
//                 ContradictionFound: contradictory row
//   value         ScaleNeeded/ScalePerformed: pivot value before scaling
//                 EliminationRow/EliminationRowDone: entry being cleared
//                 ContradictionFound: the constant
//   swap          PivotFound: a SwapPerformed step follows
//   op            row operation announced or applied (has_op)
//   pivots/variables/free_variables
//                 SolutionSummary, UniqueSolution, InfiniteSolutions
struct Step {
		StepKind kind = StepKind::PivotSearch;
		PivotCursor cursor{};
		std::uint8_t row = 0;
		double value = 0.0;
		bool swap = false;
		bool has_op = false;
		RowOp op{};
		std::uint8_t pivots = 0;
		std::uint8_t variables = 0;
		std::uint8_t free_variables = 0;
		char text[kStepTextCap]{};
};

// renders the human readable text of step (1 based indices, two decimals)
ErrorCode step_caption(In const Step& step, Out char* out, In std::size_t cap) noexcept;

// Gauss-Jordan elimination followed by solution classification, one step per
// advance() call.
//
// the engine owns its Matrix; callers only get read only views. every
// advance() lands on exactly one emission point and returns; the resume tag
// plus the saved loop indices say where the next call continues. mutations
// are never rolled back, so abandoning a run leaves the partial result.
//
// not thread safe: one owner drives one engine.
class StepEngine {
	  public:
		StepEngine() noexcept = default;
		explicit StepEngine(const Matrix& m) noexcept { reset(m); }

		// discards the current matrix and cursor; never fails
		void reset(In const Matrix& m) noexcept;

		// runs to the next emission point. returns StepOutOfRange once the run
		// is finished (state is left untouched), InvalidDimension when no
		// matrix was given. out may be null, see last_step().
		ErrorCode advance(Out Step* out) noexcept;

		// advances until exhausted; *count receives the number of steps taken
		ErrorCode run_to_end(Out std::size_t* count) noexcept;

		RunState state() const noexcept { return state_; }
		bool finished() const noexcept { return state_ == RunState::Finished; }

		// meaningful only while state() != Finished
		PivotCursor cursor() const noexcept { return cursor_; }

		MatrixView matrix() const noexcept { return matrix_.view(); }
		const Step& last_step() const noexcept { return last_; }
		std::size_t step_count() const noexcept { return steps_; }
		const Classification& classification() const noexcept { return result_; }

	  private:
		enum class Resume : std::uint8_t {
				LoopHead,
				Search,
				Swap,
				Normalize,
				Scale,
				EliminateStart,
				EliminateScan,
				EliminateApply,
				Classify,
				Verdict,
				NoSolution,
				AnalysisDone,
				Done,
		};

		Matrix matrix_{};
		RunState state_ = RunState::NotStarted;
		Resume resume_ = Resume::LoopHead;
		PivotCursor cursor_{};
		std::uint8_t pivot_row_ = 0; // row found by the last search
		std::uint8_t elim_row_ = 0;  // inner elimination loop index
		double pending_ = 0.0;       // factor announced by the previous step
		Step last_{};
		std::size_t steps_ = 0;
		Classification result_{};

		Step begin_step(StepKind kind) const noexcept;
		ErrorCode render(InOut Step& step) const noexcept;
		void commit(In const Step& step, In Resume next, Out Step* out) noexcept;

		ErrorCode on_loop_head(Out Step* out) noexcept;
		ErrorCode on_search(Out Step* out) noexcept;
		ErrorCode on_swap(Out Step* out) noexcept;
		ErrorCode on_normalize(Out Step* out) noexcept;
		ErrorCode on_scale(Out Step* out) noexcept;
		ErrorCode on_eliminate_start(Out Step* out) noexcept;
		ErrorCode on_eliminate_scan(Out Step* out) noexcept;
		ErrorCode on_eliminate_apply(Out Step* out) noexcept;
		ErrorCode on_classify(Out Step* out) noexcept;
		ErrorCode on_verdict(Out Step* out) noexcept;
		ErrorCode on_final(StepKind kind, Out Step* out) noexcept;

		bool find_contradiction(Out std::uint8_t* row) const noexcept;
};

} // namespace rref_core
