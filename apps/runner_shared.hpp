#pragma once

#include <streambuf>

namespace ortho_stitch::runner {

// Duplicates everything written to it into two stream buffers.
// Either side may be null, in which case that side is dropped.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace ortho_stitch::runner
