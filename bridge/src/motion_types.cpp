/*
 * 설명: 동작 유형 문자열 변환과 키워드 분류기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/motion_classifier_test.cpp
 */
#include "bridge/motion_types.hpp"

#include <algorithm>
#include <cctype>

namespace bridge {

namespace {
std::size_t CodePoints(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

std::string AsciiLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
  });
  return out;
}
}  // namespace

std::string_view ToString(MotionType type) {
  switch (type) {
    case MotionType::kIdle:
      return "idle";
    case MotionType::kSpeaking:
      return "speaking";
    case MotionType::kThinking:
      return "thinking";
    case MotionType::kHappy:
      return "happy";
    case MotionType::kSurprised:
      return "surprised";
    case MotionType::kAngry:
      return "angry";
    case MotionType::kSad:
      return "sad";
    case MotionType::kAgree:
      return "agree";
    case MotionType::kDisagree:
      return "disagree";
    case MotionType::kQuestion:
      return "question";
    case MotionType::kWelcome:
      return "welcome";
    case MotionType::kThanks:
      return "thanks";
    case MotionType::kApology:
      return "apology";
    case MotionType::kGoodbye:
      return "goodbye";
    case MotionType::kExcited:
      return "excited";
  }
  return "idle";
}

std::optional<MotionType> ParseMotionType(std::string_view value) {
  auto lowered = AsciiLower(value);
  for (auto type : kAllMotionTypes) {
    if (ToString(type) == lowered) {
      return type;
    }
  }
  return std::nullopt;
}

KeywordMotionClassifier::KeywordMotionClassifier()
    : entries_{
          {MotionType::kIdle, {"待机", "空闲", "等待", "默认"}},
          {MotionType::kSpeaking, {"说", "讲", "表达", "说话"}},
          {MotionType::kThinking, {"想", "思考", "思考中", "琢磨", "疑惑", "为什么", "如何", "think"}},
          {MotionType::kHappy, {"开心", "高兴", "快乐", "愉快", "欢乐", "哈哈", "笑", "太好了", "happy", "glad"}},
          {MotionType::kSurprised, {"惊讶", "意外", "哇", "天啊", "不会吧", "真的吗", "震惊", "wow"}},
          {MotionType::kAngry, {"生气", "愤怒", "恼火", "气死", "讨厌", "烦", "不爽", "angry"}},
          {MotionType::kSad, {"难过", "伤心", "悲伤", "哭", "郁闷", "失落", "痛苦", "sad"}},
          {MotionType::kAgree, {"是的", "对的", "没错", "同意", "肯定", "当然", "确实"}},
          {MotionType::kDisagree, {"不是", "不对", "错了", "不同意", "否定", "当然不", "没有"}},
          {MotionType::kQuestion, {"什么", "怎么", "如何", "哪里", "谁", "为什么", "吗", "呢"}},
          {MotionType::kWelcome, {"欢迎", "你好", "您好", "大家好", "来了", "欢迎回来", "hello"}},
          {MotionType::kThanks, {"谢谢", "感谢", "谢了", "多谢", "感谢你", "太感谢了", "thanks", "thank you"}},
          {MotionType::kApology, {"对不起", "抱歉", "不好意思", "道歉", "错怪", "抱歉抱歉", "sorry"}},
          {MotionType::kGoodbye, {"再见", "拜拜", "88", "下次见", "回头见", "告别", "goodbye", "bye"}},
          {MotionType::kExcited, {"兴奋", "激动", "太棒了", "太好了", "万岁", "厉害", "牛"}},
      } {}

MotionType KeywordMotionClassifier::Classify(std::string_view text) const {
  auto lowered = AsciiLower(text);
  if (lowered.find_first_not_of(" \t\r\n") == std::string::npos) {
    return MotionType::kIdle;
  }
  MotionType best = MotionType::kIdle;
  std::size_t best_score = 0;
  for (const auto& entry : entries_) {
    std::size_t score = 0;
    for (const auto& keyword : entry.keywords) {
      if (lowered.find(keyword) != std::string::npos) {
        score += CodePoints(keyword);
      }
    }
    // 동점이면 카탈로그 앞쪽 유형이 남는다.
    if (score > best_score) {
      best_score = score;
      best = entry.type;
    }
  }
  return best;
}

}  // namespace bridge
