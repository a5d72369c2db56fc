#include "pipeline/frame_similarity.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace interview_agent::pipeline {
namespace {

constexpr int kCompareWidth = 320;
constexpr int kCompareHeight = 180;
constexpr double kC1 = 6.5025;   // (0.01 * 255)^2
constexpr double kC2 = 58.5225;  // (0.03 * 255)^2

cv::Mat decode_grayscale(const model::byte_buffer& bytes) {
  if (bytes.empty()) {
    return {};
  }

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<std::uint8_t*>(bytes.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_GRAYSCALE);
  } catch (const cv::Exception& ex) {
    std::cerr << "[frame-gate] decode failed: " << ex.what() << '\n';
    return {};
  }
  if (decoded.empty()) {
    return {};
  }

  cv::Mat resized;
  cv::resize(decoded, resized, cv::Size(kCompareWidth, kCompareHeight), 0.0, 0.0, cv::INTER_AREA);
  cv::Mat as_float;
  resized.convertTo(as_float, CV_32F);
  return as_float;
}

double mean_ssim(const cv::Mat& first, const cv::Mat& second) {
  const cv::Size window(11, 11);
  constexpr double kSigma = 1.5;

  cv::Mat mu1;
  cv::Mat mu2;
  cv::GaussianBlur(first, mu1, window, kSigma);
  cv::GaussianBlur(second, mu2, window, kSigma);

  const cv::Mat mu1_sq = mu1.mul(mu1);
  const cv::Mat mu2_sq = mu2.mul(mu2);
  const cv::Mat mu1_mu2 = mu1.mul(mu2);

  cv::Mat sigma1_sq;
  cv::Mat sigma2_sq;
  cv::Mat sigma12;
  cv::GaussianBlur(first.mul(first), sigma1_sq, window, kSigma);
  sigma1_sq -= mu1_sq;
  cv::GaussianBlur(second.mul(second), sigma2_sq, window, kSigma);
  sigma2_sq -= mu2_sq;
  cv::GaussianBlur(first.mul(second), sigma12, window, kSigma);
  sigma12 -= mu1_mu2;

  const cv::Mat numerator = (2.0 * mu1_mu2 + kC1).mul(2.0 * sigma12 + kC2);
  const cv::Mat denominator = (mu1_sq + mu2_sq + kC1).mul(sigma1_sq + sigma2_sq + kC2);
  cv::Mat ssim_map;
  cv::divide(numerator, denominator, ssim_map);
  return std::clamp(cv::mean(ssim_map)[0], 0.0, 1.0);
}

class SsimComparator final : public FrameComparator {
 public:
  std::optional<double> similarity(const model::shared_bytes& reference,
                                   const model::shared_bytes& candidate) override {
    if (candidate == nullptr) {
      return std::nullopt;
    }

    cv::Mat reference_decoded;
    if (reference != nullptr && reference == last_candidate_) {
      reference_decoded = last_decoded_;
    } else if (reference != nullptr) {
      reference_decoded = decode_grayscale(*reference);
    }

    last_candidate_ = candidate;
    last_decoded_ = decode_grayscale(*candidate);
    if (last_decoded_.empty()) {
      return std::nullopt;
    }
    if (reference_decoded.empty()) {
      return 0.0;
    }
    return mean_ssim(reference_decoded, last_decoded_);
  }

 private:
  model::shared_bytes last_candidate_{};
  cv::Mat last_decoded_{};
};

}  // namespace

std::unique_ptr<FrameComparator> make_ssim_comparator() { return std::make_unique<SsimComparator>(); }

}  // namespace interview_agent::pipeline
