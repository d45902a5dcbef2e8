/*
 * 설명: 클라이언트가 에셋 자동 선택에 쓰는 동작 유형 태그와 텍스트 기반 분류기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/motion_classifier_test.cpp
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridge {

enum class MotionType {
  kIdle,
  kSpeaking,
  kThinking,
  kHappy,
  kSurprised,
  kAngry,
  kSad,
  kAgree,
  kDisagree,
  kQuestion,
  kWelcome,
  kThanks,
  kApology,
  kGoodbye,
  kExcited,
};

inline constexpr std::array<MotionType, 15> kAllMotionTypes = {
    MotionType::kIdle,    MotionType::kSpeaking, MotionType::kThinking, MotionType::kHappy,   MotionType::kSurprised,
    MotionType::kAngry,   MotionType::kSad,      MotionType::kAgree,    MotionType::kDisagree, MotionType::kQuestion,
    MotionType::kWelcome, MotionType::kThanks,   MotionType::kApology,  MotionType::kGoodbye, MotionType::kExcited,
};

std::string_view ToString(MotionType type);
std::optional<MotionType> ParseMotionType(std::string_view value);

class MotionClassifier {
 public:
  virtual ~MotionClassifier() = default;
  virtual MotionType Classify(std::string_view text) const = 0;
};

// 키워드가 포함될 때마다 키워드 길이(코드포인트)만큼 점수를 더하고 최고점 유형을 고른다. 매칭이 없으면 idle.
class KeywordMotionClassifier : public MotionClassifier {
 public:
  KeywordMotionClassifier();
  MotionType Classify(std::string_view text) const override;

 private:
  struct Entry {
    MotionType type;
    std::vector<std::string> keywords;
  };
  std::vector<Entry> entries_;
};

}  // namespace bridge
