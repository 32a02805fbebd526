// Sorting algorithms measured by the sortscale harness.
// Every sort here is stable and only needs operator< on the element type.

#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace sortscale {

// A natural run as seen by scan_runs (before any reversal).
struct RunInfo {
  std::size_t start = 0;
  std::size_t length = 0;
  bool descending = false;
};

// Counters filled by hybrid_sort when a stats pointer is passed.
struct HybridStats {
  std::size_t min_run = 0;
  std::size_t runs = 0;          // runs pushed on the pending stack
  std::size_t reversed_runs = 0; // strictly descending runs flipped in place
  std::size_t merges = 0;
  std::size_t max_stack = 0;     // deepest pending stack observed
  std::size_t gallops = 0;       // entries into galloping mode
};

namespace algos {

// Inputs shorter than this are sorted as a single insertion-sorted run.
inline constexpr std::size_t kMinMerge = 64;
// Consecutive wins needed before a merge starts galloping.
inline constexpr std::size_t kMinGallop = 7;

template <class Iter> inline void insertion_sort(Iter first, Iter last) {
  for (Iter i = first + (first == last ? 0 : 1); i < last; ++i) {
    auto key = std::move(*i);
    Iter j = i;
    while (j > first && key < *(j - 1)) {
      *j = std::move(*(j - 1));
      --j;
    }
    *j = std::move(key);
  }
}

template <class T> inline void insertion_sort(std::vector<T> &v) {
  insertion_sort(v.begin(), v.end());
}

namespace detail {

template <class T>
inline void merge_halves(std::vector<T> &v, std::vector<T> &buf,
                         std::size_t lo, std::size_t mid, std::size_t hi) {
  std::size_t a = lo, b = mid, k = lo;
  while (a < mid && b < hi) {
    // ties go to the left half
    if (v[b] < v[a])
      buf[k++] = std::move(v[b++]);
    else
      buf[k++] = std::move(v[a++]);
  }
  auto at = [](auto &c, std::size_t i) {
    return c.begin() + static_cast<std::ptrdiff_t>(i);
  };
  std::move(at(v, a), at(v, mid), at(buf, k));
  k += (mid - a);
  std::move(at(v, b), at(v, hi), at(buf, k));
  std::move(at(buf, lo), at(buf, hi), at(v, lo));
}

template <class T>
void merge_sort_rec(std::vector<T> &v, std::vector<T> &buf, std::size_t lo,
                    std::size_t hi) {
  if (hi - lo <= 1)
    return;
  const std::size_t mid = lo + (hi - lo) / 2;
  merge_sort_rec(v, buf, lo, mid);
  merge_sort_rec(v, buf, mid, hi);
  merge_halves(v, buf, lo, mid, hi);
}

} // namespace detail

// Top-down merge sort. One scratch buffer of v.size() lives for the call.
template <class T> inline void merge_sort(std::vector<T> &v) {
  if (v.size() < 2)
    return;
  std::vector<T> buf(v.size());
  detail::merge_sort_rec(v, buf, 0, v.size());
}

// Minimum run length for an input of n elements. Keeps n / min_run close
// to (and not above) a power of two so the final merges stay balanced.
inline std::size_t compute_min_run(std::size_t n) {
  std::size_t r = 0;
  while (n >= kMinMerge) {
    r |= (n & 1);
    n >>= 1;
  }
  return n + r;
}

// Natural runs of v without modifying it. A descending run is strictly
// descending; everything else is a non-descending run.
template <class T> std::vector<RunInfo> scan_runs(const std::vector<T> &v) {
  std::vector<RunInfo> out;
  const std::size_t n = v.size();
  std::size_t lo = 0;
  while (lo < n) {
    std::size_t j = lo + 1;
    bool desc = false;
    if (j < n) {
      if (v[j] < v[j - 1]) {
        desc = true;
        ++j;
        while (j < n && v[j] < v[j - 1])
          ++j;
      } else {
        ++j;
        while (j < n && !(v[j] < v[j - 1]))
          ++j;
      }
    }
    out.push_back(RunInfo{lo, j - lo, desc});
    lo = j;
  }
  return out;
}

namespace detail {

// Leftmost k in [0, len] with base[k - 1] < key <= base[k], searched
// outward from hint.
template <class Iter, class T>
std::ptrdiff_t gallop_left(const T &key, Iter base, std::ptrdiff_t len,
                           std::ptrdiff_t hint) {
  std::ptrdiff_t last_ofs = 0;
  std::ptrdiff_t ofs = 1;
  if (base[hint] < key) {
    // base[hint + last_ofs] < key <= base[hint + ofs]
    const std::ptrdiff_t max_ofs = len - hint;
    while (ofs < max_ofs && base[hint + ofs] < key) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= 0)
        ofs = max_ofs;
    }
    if (ofs > max_ofs)
      ofs = max_ofs;
    last_ofs += hint;
    ofs += hint;
  } else {
    // base[hint - ofs] < key <= base[hint - last_ofs]
    const std::ptrdiff_t max_ofs = hint + 1;
    while (ofs < max_ofs && !(base[hint - ofs] < key)) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= 0)
        ofs = max_ofs;
    }
    if (ofs > max_ofs)
      ofs = max_ofs;
    const std::ptrdiff_t k = last_ofs;
    last_ofs = hint - ofs;
    ofs = hint - k;
  }
  ++last_ofs;
  while (last_ofs < ofs) {
    const std::ptrdiff_t m = last_ofs + ((ofs - last_ofs) >> 1);
    if (base[m] < key)
      last_ofs = m + 1;
    else
      ofs = m;
  }
  return ofs;
}

// Rightmost k in [0, len] with base[k - 1] <= key < base[k].
template <class Iter, class T>
std::ptrdiff_t gallop_right(const T &key, Iter base, std::ptrdiff_t len,
                            std::ptrdiff_t hint) {
  std::ptrdiff_t last_ofs = 0;
  std::ptrdiff_t ofs = 1;
  if (key < base[hint]) {
    // base[hint - ofs] <= key < base[hint - last_ofs]
    const std::ptrdiff_t max_ofs = hint + 1;
    while (ofs < max_ofs && key < base[hint - ofs]) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= 0)
        ofs = max_ofs;
    }
    if (ofs > max_ofs)
      ofs = max_ofs;
    const std::ptrdiff_t k = last_ofs;
    last_ofs = hint - ofs;
    ofs = hint - k;
  } else {
    // base[hint + last_ofs] <= key < base[hint + ofs]
    const std::ptrdiff_t max_ofs = len - hint;
    while (ofs < max_ofs && !(key < base[hint + ofs])) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= 0)
        ofs = max_ofs;
    }
    if (ofs > max_ofs)
      ofs = max_ofs;
    last_ofs += hint;
    ofs += hint;
  }
  ++last_ofs;
  while (last_ofs < ofs) {
    const std::ptrdiff_t m = last_ofs + ((ofs - last_ofs) >> 1);
    if (key < base[m])
      ofs = m;
    else
      last_ofs = m + 1;
  }
  return ofs;
}

// Insertion sort of [first, last) where [first, start) is already sorted.
// The insertion point is found by binary search; equal keys stay in order.
template <class Iter>
inline void binary_insertion_sort(Iter first, Iter start, Iter last) {
  if (start == first)
    ++start;
  for (; start < last; ++start) {
    auto pos = std::upper_bound(first, start, *start);
    if (pos != start) {
      auto x = std::move(*start);
      std::move_backward(pos, start, start + 1);
      *pos = std::move(x);
    }
  }
}

// Length of the run starting at lo. A strictly descending run is reversed
// in place so every run comes back ascending.
template <class T>
std::size_t count_run_and_make_ascending(std::vector<T> &v, std::size_t lo,
                                         std::size_t hi, bool &descending) {
  descending = false;
  std::size_t j = lo + 1;
  if (j >= hi)
    return hi - lo;
  if (v[j] < v[j - 1]) {
    descending = true;
    ++j;
    while (j < hi && v[j] < v[j - 1])
      ++j;
    std::reverse(v.begin() + static_cast<std::ptrdiff_t>(lo),
                 v.begin() + static_cast<std::ptrdiff_t>(j));
  } else {
    ++j;
    while (j < hi && !(v[j] < v[j - 1]))
      ++j;
  }
  return j - lo;
}

// Pending-run stack plus merge state for one hybrid_sort call.
template <class T> class RunMerger {
public:
  RunMerger(std::vector<T> &v, HybridStats &stats) : v_(v), stats_(stats) {
    runs_.reserve(64);
  }

  void push(std::size_t base, std::size_t len) {
    runs_.push_back(Run{static_cast<std::ptrdiff_t>(base),
                        static_cast<std::ptrdiff_t>(len)});
    ++stats_.runs;
    stats_.max_stack = std::max(stats_.max_stack, runs_.size());
  }

  // Restores, for the top of the stack,
  //   len[i-2] > len[i-1] + len[i]   and   len[i-1] > len[i]
  // and the first condition one level deeper.
  void collapse() {
    while (runs_.size() > 1) {
      std::size_t i = runs_.size() - 2;
      if ((i > 0 && len(i - 1) <= len(i) + len(i + 1)) ||
          (i > 1 && len(i - 2) <= len(i - 1) + len(i))) {
        if (len(i - 1) < len(i + 1))
          --i;
        merge_at(i);
      } else if (len(i) <= len(i + 1)) {
        merge_at(i);
      } else {
        break;
      }
    }
  }

  void force_collapse() {
    while (runs_.size() > 1) {
      std::size_t i = runs_.size() - 2;
      if (i > 0 && len(i - 1) < len(i + 1))
        --i;
      merge_at(i);
    }
  }

private:
  struct Run {
    std::ptrdiff_t base;
    std::ptrdiff_t len;
  };

  std::ptrdiff_t len(std::size_t i) const { return runs_[i].len; }

  // Merges runs i and i + 1 (i is second or third from the top).
  void merge_at(std::size_t i) {
    std::ptrdiff_t ssa = runs_[i].base;
    std::ptrdiff_t na = runs_[i].len;
    const std::ptrdiff_t ssb = runs_[i + 1].base;
    std::ptrdiff_t nb = runs_[i + 1].len;
    runs_[i].len = na + nb;
    runs_.erase(runs_.begin() + static_cast<std::ptrdiff_t>(i) + 1);
    ++stats_.merges;

    // Elements of a not greater than b[0] are already in place.
    const std::ptrdiff_t k = gallop_right(v_[static_cast<std::size_t>(ssb)],
                                          v_.begin() + ssa, na, 0);
    ssa += k;
    na -= k;
    if (na == 0)
      return;
    // Elements of b not less than the last of a are already in place.
    nb = gallop_left(v_[static_cast<std::size_t>(ssa + na - 1)],
                     v_.begin() + ssb, nb, nb - 1);
    if (nb == 0)
      return;
    if (na <= nb)
      merge_lo(ssa, na, ssb, nb);
    else
      merge_hi(ssa, na, ssb, nb);
  }

  // a = [ssa, ssa + na) is copied out and merged left to right.
  // Requires na <= nb, b[0] < a[0] and a[last] > b[last].
  void merge_lo(std::ptrdiff_t ssa, std::ptrdiff_t na, std::ptrdiff_t ssb,
                std::ptrdiff_t nb) {
    tmp_.resize(static_cast<std::size_t>(na));
    std::move(v_.begin() + ssa, v_.begin() + ssa + na, tmp_.begin());
    std::ptrdiff_t dest = ssa;
    std::ptrdiff_t pa = 0; // into tmp_
    std::ptrdiff_t pb = ssb;

    v_[idx(dest++)] = std::move(v_[idx(pb++)]);
    if (--nb == 0)
      goto succeed;
    if (na == 1)
      goto copy_b;

    for (;;) {
      std::size_t acount = 0;
      std::size_t bcount = 0;
      for (;;) {
        if (v_[idx(pb)] < tmp_[idx(pa)]) {
          v_[idx(dest++)] = std::move(v_[idx(pb++)]);
          ++bcount;
          acount = 0;
          if (--nb == 0)
            goto succeed;
          if (bcount >= min_gallop_)
            break;
        } else {
          v_[idx(dest++)] = std::move(tmp_[idx(pa++)]);
          ++acount;
          bcount = 0;
          if (--na == 1)
            goto copy_b;
          if (acount >= min_gallop_)
            break;
        }
      }

      ++stats_.gallops;
      ++min_gallop_;
      do {
        min_gallop_ -= (min_gallop_ > 1);
        std::ptrdiff_t k = gallop_right(v_[idx(pb)], tmp_.begin() + pa, na, 0);
        acount = static_cast<std::size_t>(k);
        if (k) {
          std::move(tmp_.begin() + pa, tmp_.begin() + pa + k,
                    v_.begin() + dest);
          dest += k;
          pa += k;
          na -= k;
          if (na == 1)
            goto copy_b;
          if (na == 0)
            goto succeed;
        }
        v_[idx(dest++)] = std::move(v_[idx(pb++)]);
        if (--nb == 0)
          goto succeed;

        k = gallop_left(tmp_[idx(pa)], v_.begin() + pb, nb, 0);
        bcount = static_cast<std::size_t>(k);
        if (k) {
          std::move(v_.begin() + pb, v_.begin() + pb + k, v_.begin() + dest);
          dest += k;
          pb += k;
          nb -= k;
          if (nb == 0)
            goto succeed;
        }
        v_[idx(dest++)] = std::move(tmp_[idx(pa++)]);
        if (--na == 1)
          goto copy_b;
      } while (acount >= kMinGallop || bcount >= kMinGallop);
      ++min_gallop_;
    }

  succeed:
    if (na)
      std::move(tmp_.begin() + pa, tmp_.begin() + pa + na, v_.begin() + dest);
    return;
  copy_b:
    // the last element of a belongs after everything left in b
    std::move(v_.begin() + pb, v_.begin() + pb + nb, v_.begin() + dest);
    v_[idx(dest + nb)] = std::move(tmp_[idx(pa)]);
  }

  // b = [ssb, ssb + nb) is copied out and merged right to left.
  // Requires na > nb, b[0] < a[0] and a[last] > b[last].
  void merge_hi(std::ptrdiff_t ssa, std::ptrdiff_t na, std::ptrdiff_t ssb,
                std::ptrdiff_t nb) {
    tmp_.resize(static_cast<std::size_t>(nb));
    std::move(v_.begin() + ssb, v_.begin() + ssb + nb, tmp_.begin());
    std::ptrdiff_t dest = ssb + nb - 1;
    std::ptrdiff_t pa = ssa + na - 1;
    std::ptrdiff_t pb = nb - 1; // into tmp_

    v_[idx(dest--)] = std::move(v_[idx(pa--)]);
    if (--na == 0)
      goto succeed;
    if (nb == 1)
      goto copy_a;

    for (;;) {
      std::size_t acount = 0;
      std::size_t bcount = 0;
      for (;;) {
        if (tmp_[idx(pb)] < v_[idx(pa)]) {
          v_[idx(dest--)] = std::move(v_[idx(pa--)]);
          ++acount;
          bcount = 0;
          if (--na == 0)
            goto succeed;
          if (acount >= min_gallop_)
            break;
        } else {
          v_[idx(dest--)] = std::move(tmp_[idx(pb--)]);
          ++bcount;
          acount = 0;
          if (--nb == 1)
            goto copy_a;
          if (bcount >= min_gallop_)
            break;
        }
      }

      ++stats_.gallops;
      ++min_gallop_;
      do {
        min_gallop_ -= (min_gallop_ > 1);
        std::ptrdiff_t k =
            na - gallop_right(tmp_[idx(pb)], v_.begin() + ssa, na, na - 1);
        acount = static_cast<std::size_t>(k);
        if (k) {
          dest -= k;
          pa -= k;
          std::move_backward(v_.begin() + (pa + 1), v_.begin() + (pa + 1 + k),
                             v_.begin() + (dest + 1 + k));
          na -= k;
          if (na == 0)
            goto succeed;
        }
        v_[idx(dest--)] = std::move(tmp_[idx(pb--)]);
        if (--nb == 1)
          goto copy_a;

        k = nb - gallop_left(v_[idx(pa)], tmp_.begin(), nb, nb - 1);
        bcount = static_cast<std::size_t>(k);
        if (k) {
          dest -= k;
          pb -= k;
          std::move(tmp_.begin() + (pb + 1), tmp_.begin() + (pb + 1 + k),
                    v_.begin() + (dest + 1));
          nb -= k;
          if (nb == 1)
            goto copy_a;
          if (nb == 0)
            goto succeed;
        }
        v_[idx(dest--)] = std::move(v_[idx(pa--)]);
        if (--na == 0)
          goto succeed;
      } while (acount >= kMinGallop || bcount >= kMinGallop);
      ++min_gallop_;
    }

  succeed:
    if (nb)
      std::move(tmp_.begin(), tmp_.begin() + nb, v_.begin() + (dest - (nb - 1)));
    return;
  copy_a:
    // the first element of b belongs before everything left in a
    dest -= na;
    pa -= na;
    std::move_backward(v_.begin() + (pa + 1), v_.begin() + (pa + 1 + na),
                       v_.begin() + (dest + 1 + na));
    v_[idx(dest)] = std::move(tmp_[idx(pb)]);
  }

  static std::size_t idx(std::ptrdiff_t i) {
    return static_cast<std::size_t>(i);
  }

  std::vector<T> &v_;
  HybridStats &stats_;
  std::vector<T> tmp_;
  std::vector<Run> runs_;
  std::size_t min_gallop_ = kMinGallop;
};

} // namespace detail

// Run-adaptive merge sort: natural runs, short runs extended by insertion,
// balanced run stack, galloping merges. n - 1 comparisons on sorted or
// strictly reversed input, O(n log n) in the worst case.
template <class T>
void hybrid_sort(std::vector<T> &v, HybridStats *stats = nullptr) {
  HybridStats local;
  HybridStats &st = stats ? *stats : local;
  st = HybridStats{};
  const std::size_t n = v.size();
  if (n < 2)
    return;

  const std::size_t min_run = compute_min_run(n);
  st.min_run = min_run;
  detail::RunMerger<T> merger(v, st);

  std::size_t lo = 0;
  while (lo < n) {
    bool descending = false;
    std::size_t run_len =
        detail::count_run_and_make_ascending(v, lo, n, descending);
    if (descending)
      ++st.reversed_runs;
    if (run_len < min_run) {
      const std::size_t force = std::min(min_run, n - lo);
      auto base = v.begin() + static_cast<std::ptrdiff_t>(lo);
      detail::binary_insertion_sort(base,
                                    base + static_cast<std::ptrdiff_t>(run_len),
                                    base + static_cast<std::ptrdiff_t>(force));
      run_len = force;
    }
    merger.push(lo, run_len);
    merger.collapse();
    lo += run_len;
  }
  merger.force_collapse();
}

} // namespace algos
} // namespace sortscale
