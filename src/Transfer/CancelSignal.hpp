#ifndef MEDIAGRAB_CANCEL_SIGNAL_HPP_
#define MEDIAGRAB_CANCEL_SIGNAL_HPP_

#include <atomic>

namespace mediagrab {

enum class CancelMode { None = 0, Pause = 1, Cancel = 2 };

// 协作式停止信号：工作线程在每个 I/O 块之间检查一次
class CancelSignal {
 public:
  CancelSignal() = default;
  CancelSignal(const CancelSignal&) = delete;
  CancelSignal& operator=(const CancelSignal&) = delete;

  // Cancel 覆盖 Pause，反之不行
  void request(CancelMode mode) {
    int wanted = static_cast<int>(mode);
    int current = mode_.load();
    while (wanted > current && !mode_.compare_exchange_weak(current, wanted)) {
    }
  }

  CancelMode mode() const { return static_cast<CancelMode>(mode_.load()); }
  bool requested() const { return mode_.load() != 0; }

 private:
  std::atomic<int> mode_{0};
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_CANCEL_SIGNAL_HPP_
