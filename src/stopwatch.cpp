#include "precompiled.hpp"
#include "stopwatch.hpp"

using std::chrono::duration_cast;

static std::chrono::microseconds from_timeval(const timeval& tv) {
	return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}

Stopwatch::Stopwatch(int getrusage_who) : data_(getrusage_who), getrusage_who_(getrusage_who) {}

Stopwatch Stopwatch::process() {
	return Stopwatch(RUSAGE_SELF);
}

void Stopwatch::reset() {
	data_ = StopwatchData(getrusage_who_);
}

Stopwatch::Result Stopwatch::elapsed() const {
	auto end = StopwatchData(getrusage_who_);
	return {data_, end};
}

Stopwatch::StopwatchData::StopwatchData(int getrusage_who) : time(best_clock::now()) {
	usage = {};
	getrusage(getrusage_who, &usage);
}

Stopwatch::Result::Result(StopwatchData start, StopwatchData end) : start_(start), end_(end) {}

template<class Duration>
Duration Stopwatch::Result::elapsed() const {
	return duration_cast<Duration>(end_.time - start_.time);
}
unsigned long Stopwatch::Result::millis() const {
	return elapsed<std::chrono::milliseconds>().count();
}
unsigned long Stopwatch::Result::nanos() const {
	return elapsed<std::chrono::nanoseconds>().count();
}
std::string Stopwatch::Result::hms() const {
	auto diff = end_.time - start_.time;
	auto hours = duration_cast<std::chrono::hours>(diff);
	auto minutes = duration_cast<std::chrono::minutes>(diff) - hours;
	auto seconds = duration_cast<std::chrono::seconds>(diff) - hours - minutes;
	return fmt::format("{}h{}m{}s", hours.count(), minutes.count(), seconds.count());
}

template<class Duration>
Duration Stopwatch::Result::cpuTime() const {
	auto user = from_timeval(end_.usage.ru_utime) - from_timeval(start_.usage.ru_utime);
	auto system = from_timeval(end_.usage.ru_stime) - from_timeval(start_.usage.ru_stime);
	return duration_cast<Duration>(user + system);
}
unsigned long Stopwatch::Result::cpuMillis() const {
	return cpuTime<std::chrono::milliseconds>().count();
}
unsigned long Stopwatch::Result::cpuNanos() const {
	return cpuTime<std::chrono::nanoseconds>().count();
}

double Stopwatch::Result::utilization() const {
	unsigned long wall = nanos();
	return wall ? (double)cpuNanos() / wall : 0.0;
}

double Stopwatch::Result::nanosPer(unsigned long n) const {
	return n ? (double)nanos() / n : 0.0;
}
