#pragma once

#include <cstdint>
#include <vector>

namespace dictation_cpp
{

constexpr uint32_t kTargetSampleRate = 16000;

/// 임의 샘플레이트 mono 입력을 16 kHz로 변환
/// 16 kHz는 그대로 복사, 16 kHz 미만(업샘플링)은 빈 결과, 초과는 블록 평균으로 다운샘플
std::vector<float> downsample_to_16k(const std::vector<float> & input, uint32_t input_rate);

/// 마이크 감도(%)를 게인으로 변환. 50..300% → 0.5..3.0
float mic_sensitivity_gain(int sensitivity_percent);
/// 게인 적용 후 [-1, 1]로 클리핑. gain == 1이면 변경 없음
void apply_gain(std::vector<float> & samples, float gain);

std::vector<float> pcm16_to_float(const std::vector<int16_t> & pcm);

}  // namespace dictation_cpp
