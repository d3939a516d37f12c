#pragma once
#include <string_view>
#include <vector>
#include <cstddef>

namespace tw {

// Lightweight view over one tokenized row. Field storage belongs to the
// tokenizer and stays valid until its next feed().
class RecordView {
public:
  RecordView() = default;
  explicit RecordView(const std::vector<std::string_view>* fields) : fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  const std::vector<std::string_view>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string_view>* fields_{nullptr};
};

}
