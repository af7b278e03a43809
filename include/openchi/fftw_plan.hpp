#pragma once

#include <complex>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <fftw3.h>

namespace open_chi {

/// FFTW planning and plan destruction are not thread-safe; all plans in the library are made under this lock
std::mutex& fftw_planner_mutex();

/// Precision dependent part of the FFTW interface
template <typename T> struct fftw_traits;

template <>
struct fftw_traits<double> {
    typedef fftw_plan plan_type;
    static plan_type plan_many(int rank, const int* n, int howmany, std::complex<double>* data, int stride, int dist, int sign) {
        fftw_complex* d = reinterpret_cast<fftw_complex*>(data);
        return fftw_plan_many_dft(rank, n, howmany, d, nullptr, stride, dist, d, nullptr, stride, dist, sign, FFTW_ESTIMATE);
        }
    static void execute(plan_type p) { fftw_execute(p); }
    static void destroy(plan_type p) { fftw_destroy_plan(p); }
};

template <>
struct fftw_traits<long double> {
    typedef fftwl_plan plan_type;
    static plan_type plan_many(int rank, const int* n, int howmany, std::complex<long double>* data, int stride, int dist, int sign) {
        fftwl_complex* d = reinterpret_cast<fftwl_complex*>(data);
        return fftwl_plan_many_dft(rank, n, howmany, d, nullptr, stride, dist, d, nullptr, stride, dist, sign, FFTW_ESTIMATE);
        }
    static void execute(plan_type p) { fftwl_execute(p); }
    static void destroy(plan_type p) { fftwl_destroy_plan(p); }
};

/// A batch of in-place multidimensional complex transforms on a caller-owned buffer.
/// The buffer must outlive the plan. No normalization is applied.
template <typename T>
class fft_plan {
public:
    typedef fftw_traits<T> traits;

    /// \param[in] dims     sizes of the transformed axes
    /// \param[in] howmany  number of transforms in the batch
    /// \param[in] stride   distance between consecutive elements of one transform
    /// \param[in] dist     distance between the first elements of consecutive transforms
    /// \param[in] sign     FFTW_FORWARD (e^{-i...}) or FFTW_BACKWARD (e^{+i...})
    fft_plan(std::vector<int> const& dims, int howmany, int stride, int dist, int sign, std::complex<T>* data)
    {
        std::lock_guard<std::mutex> lock(fftw_planner_mutex());
        plan_ = traits::plan_many(int(dims.size()), dims.data(), howmany, data, stride, dist, sign);
        if (!plan_) throw std::runtime_error("FFTW failed to create a plan");
    }
    ~fft_plan() {
        std::lock_guard<std::mutex> lock(fftw_planner_mutex());
        traits::destroy(plan_);
    }
    fft_plan(fft_plan const&) = delete;
    fft_plan& operator=(fft_plan const&) = delete;

    void operator()() const { traits::execute(plan_); }

private:
    typename traits::plan_type plan_;
};

} // end of namespace open_chi
