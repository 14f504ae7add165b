#include "precompiled.hpp"
#include "double_double.hpp"
#include "range.hpp"
#include "search.hpp"
#include "intervals.hpp"
#include "stopwatch.hpp"
#include "util.hpp"

using namespace rangesearch;
using namespace std::literals::string_view_literals;
using std::vector;

template<typename Range>
static void print_query(const Range& r, double x) {
	auto window = relativewindow(r, closed_interval{x, x});
	fmt::print("query {}\n", x);
	fmt::print("  unsafe first {}, last {}, nearest {}\n",
			unsafe_searchsortedfirst(r, x), unsafe_searchsortedlast(r, x), unsafe_searchsortednearest(r, x));
	fmt::print("  bounded first {}, last {}, nearest {}\n",
			searchsortedfirst(r, x), searchsortedlast(r, x), searchsortednearest(r, x));
	fmt::print("  relative offset {} (value {})\n", window.indices.first(), window.values.first());
}

template<typename Range>
static void run_benchmark(const Range& r, unsigned long queries, unsigned long seed) {
	double lo = r.first(), hi = r.last();
	if (hi < lo)
		std::swap(lo, hi);
	//Spill 10% past each end so the extrapolating paths get exercised too.
	double margin = (hi - lo) / 10;
	std::mt19937 gen(seed);
	std::uniform_real_distribution<double> dist(lo - margin, hi + margin);
	vector<double> needles;
	needles.reserve(queries);
	for (unsigned long i = 0; i < queries; ++i)
		needles.push_back(dist(gen));

	index_type checksum = 0;
	Stopwatch stopwatch = Stopwatch::process();
	for (double n : needles)
		checksum += unsafe_searchsortednearest(r, n);
	auto times = stopwatch.elapsed();

	fmt::print("{} queries in {} ms ({}), {:.1f} ns/query, {} cpu-ms ({:.2f}), checksum {}.\n",
			queries, times.millis(), times.hms(), times.nanosPer(queries), times.cpuMillis(),
			times.utilization(), checksum);
}

template<typename Range>
static void run(const Range& r, const std::optional<double>& query, unsigned long queries, unsigned long seed) {
	if (query)
		print_query(r, *query);
	else
		run_benchmark(r, queries, seed);
}

int main(int argc, char* argv[]) {
	std::optional<double> start, step, step_lo, query;
	std::optional<index_type> length;
	unsigned long queries = 1000000, seed = 0;
	try {
		for (int i = 1; i < argc; ++i) {
			if (i + 1 == argc) {
				fmt::print(stderr, "option {} needs a value\n", argv[i]);
				return 1;
			}
			if (argv[i] == "--start"sv)
				start = from_string<double>(argv[++i]);
			else if (argv[i] == "--step"sv)
				step = from_string<double>(argv[++i]);
			else if (argv[i] == "--step-lo"sv)
				step_lo = from_string<double>(argv[++i]);
			else if (argv[i] == "--length"sv)
				length = from_string<index_type>(argv[++i]);
			else if (argv[i] == "--queries"sv)
				queries = from_string<unsigned long>(argv[++i]);
			else if (argv[i] == "--seed"sv)
				seed = from_string<unsigned long>(argv[++i]);
			else if (argv[i] == "--query"sv)
				query = from_string<double>(argv[++i]);
			else {
				fmt::print(stderr, "unknown option: {}\n", argv[i]);
				return 1;
			}
		}
		if (!start || !step || !length) {
			fmt::print(stderr, "required options not passed (--start, --step, --length)\n");
			return 1;
		}

		if (step_lo) {
			step_range<double, double_double<double>> r(*start, fast_two_sum(*step, *step_lo), *length);
			run(r, query, queries, seed);
		} else {
			step_range<double> r(*start, *step, *length);
			run(r, query, queries, seed);
		}
	} catch (const std::logic_error& e) {
		//bad options, zero steps, and NaN queries
		fmt::print(stderr, "{}\n", e.what());
		return 1;
	} catch (const boost::numeric::bad_numeric_cast& e) {
		//queries too far out for an index
		fmt::print(stderr, "{}\n", e.what());
		return 1;
	}
	return 0;
}
