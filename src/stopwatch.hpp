/*
 * File:   stopwatch.hpp
 *
 * Wall-clock and getrusage() CPU time between two points.
 */

#ifndef RANGESEARCH_STOPWATCH_HPP_INCLUDED
#define RANGESEARCH_STOPWATCH_HPP_INCLUDED

#include <chrono>
#include <string>
#include <type_traits>
#include <sys/resource.h>

class Stopwatch {
private:
	//https://stackoverflow.com/a/37440647/3614835
	using best_clock = std::conditional_t<std::chrono::high_resolution_clock::is_steady,
			std::chrono::high_resolution_clock,
			std::chrono::steady_clock>;
	struct StopwatchData {
		explicit StopwatchData(int getrusage_who);
		best_clock::time_point time;
		rusage usage;
	};
public:
	class Result {
	public:
		Result(StopwatchData start, StopwatchData end);

		unsigned long millis() const;
		unsigned long nanos() const;
		std::string hms() const;

		unsigned long cpuMillis() const;
		unsigned long cpuNanos() const;

		/**
		 * CPU time over wall time; above 1 only with multiple threads.
		 */
		double utilization() const;
		/**
		 * Average wall time per operation, for n operations in the measured
		 * interval.
		 */
		double nanosPer(unsigned long n) const;
	private:
		StopwatchData start_, end_;

		template<class Duration>
		Duration elapsed() const;
		template<class Duration>
		Duration cpuTime() const;
	};

	/**
	 * Returns a Stopwatch measuring the whole process.
	 */
	static Stopwatch process();
	/**
	 * Resets the start point.
	 */
	void reset();
	/**
	 * Returns the time since construction or the last reset().  Can be
	 * called repeatedly to measure from the same start point.
	 */
	Result elapsed() const;
private:
	explicit Stopwatch(int getrusage_who);
	StopwatchData data_;
	int getrusage_who_;
};

#endif /* RANGESEARCH_STOPWATCH_HPP_INCLUDED */
