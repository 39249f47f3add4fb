#include "rref_core/step_engine.hpp"

#include "rref_core/writer.hpp"

namespace rref_core {
namespace {

// Writer that remembers the first failure so a caption reads as one chain
struct Text {
		Writer w;
		ErrorCode ec = ErrorCode::Ok;

		Text& s(const char* str) noexcept {
				if (is_ok(ec))
						ec = w.append(str);
				return *this;
		}
		Text& row(std::uint8_t r) noexcept {
				if (is_ok(ec))
						ec = w.append_index1(r);
				return *this;
		}
		Text& num(double v) noexcept {
				if (is_ok(ec))
						ec = w.append_f64(v);
				return *this;
		}
		Text& count(std::uint8_t n) noexcept {
				if (is_ok(ec))
						ec = w.append_u64(n);
				return *this;
		}
};

} // namespace

const char* step_kind_name(StepKind kind) noexcept {
		switch (kind) {
		case StepKind::PivotSearch:
				return "PivotSearch";
		case StepKind::NoPivotInColumn:
				return "NoPivotInColumn";
		case StepKind::PivotFound:
				return "PivotFound";
		case StepKind::SwapPerformed:
				return "SwapPerformed";
		case StepKind::ScaleNeeded:
				return "ScaleNeeded";
		case StepKind::ScalePerformed:
				return "ScalePerformed";
		case StepKind::PivotAlreadyOne:
				return "PivotAlreadyOne";
		case StepKind::EliminationStart:
				return "EliminationStart";
		case StepKind::EliminationRow:
				return "EliminationRow";
		case StepKind::EliminationRowDone:
				return "EliminationRowDone";
		case StepKind::ColumnComplete:
				return "ColumnComplete";
		case StepKind::Complete:
				return "Complete";
		case StepKind::ContradictionFound:
				return "ContradictionFound";
		case StepKind::NoSolution:
				return "NoSolution";
		case StepKind::SolutionSummary:
				return "SolutionSummary";
		case StepKind::UniqueSolution:
				return "UniqueSolution";
		case StepKind::InfiniteSolutions:
				return "InfiniteSolutions";
		case StepKind::AnalysisComplete:
				return "AnalysisComplete";
		case StepKind::NotApplicable:
				return "NotApplicable";
		}
		return "Unknown";
}

ErrorCode step_caption(const Step& step, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Text t{Writer{out, cap, 0}};
		const std::uint8_t r = step.cursor.row;
		const std::uint8_t c = step.cursor.col;

		switch (step.kind) {
		case StepKind::PivotSearch:
				t.s("Finding pivot in Column ").row(c).s(", at or below Row ").row(r).s(".");
				break;
		case StepKind::NoPivotInColumn:
				t.s("Column ").row(c).s(" has no pivot. Moving to next column.");
				break;
		case StepKind::PivotFound:
				t.s("Pivot found at (").row(step.row).s(", ").row(c).s(").");
				if (step.swap)
						t.s(" Swapping R").row(r).s(" and R").row(step.row).s(".");
				else
						t.s(" No swap needed.");
				break;
		case StepKind::SwapPerformed:
				t.s("R").row(r).s(" and R").row(step.row).s(" swapped.");
				break;
		case StepKind::ScaleNeeded:
				t.s("Scaling R").row(r).s(" by 1 / ").num(step.value).s(" to make pivot = 1.");
				break;
		case StepKind::ScalePerformed:
				t.s("R").row(r).s(" scaled.");
				break;
		case StepKind::PivotAlreadyOne:
				t.s("Pivot is already 1. No scaling needed.");
				break;
		case StepKind::EliminationStart:
				t.s("Eliminating other entries in Column ").row(c).s(".");
				break;
		case StepKind::EliminationRow:
				t.s("Eliminating in R").row(step.row).s(":  R").row(step.row).s(" = R").row(step.row);
				t.s(" - (").num(step.value).s(") * R").row(r).s(".");
				break;
		case StepKind::EliminationRowDone:
				t.s("R").row(step.row).s(" updated.");
				break;
		case StepKind::ColumnComplete:
				t.s("Column ").row(c).s(" is complete.");
				break;
		case StepKind::Complete:
				t.s("RREF calculation complete. Analyzing system solution...");
				break;
		case StepKind::ContradictionFound:
				t.s("Inconsistency found in R").row(step.row).s(": [ 0 ... 0 | ").num(step.value).s(" ].");
				break;
		case StepKind::NoSolution:
				t.s("This means 0 equals a non-zero number. The system has NO SOLUTION.");
				break;
		case StepKind::SolutionSummary:
				t.s("Analysis found ").count(step.pivots).s(" pivot(s) for ").count(step.variables).s(" variable(s).");
				break;
		case StepKind::UniqueSolution:
				t.s("There are no free variables. The system has a UNIQUE SOLUTION.");
				break;
		case StepKind::InfiniteSolutions:
				t.s("There are ").count(step.free_variables);
				t.s(" free variable(s). The system has an INFINITE number of solutions.");
				break;
		case StepKind::AnalysisComplete:
				t.s("Analysis complete.");
				break;
		case StepKind::NotApplicable:
				t.s("Matrix has only one column. Solution analysis is not applicable.");
				break;
		default:
				return ErrorCode::Internal;
		}
		return t.ec;
}

} // namespace rref_core
