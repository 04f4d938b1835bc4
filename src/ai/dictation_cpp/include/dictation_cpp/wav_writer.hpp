#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dictation_cpp
{

class WavWriter
{
public:
  WavWriter();

  /// 임시 디렉토리에 프로세스/호출마다 겹치지 않는 경로 생성 (확장자 제외)
  std::string make_temp_prefix(const std::string & tag) const;
  bool write_float_mono(
    const std::string & file_path,
    const std::vector<float> & samples,
    uint32_t sample_rate) const;
};

/// 경로 목록을 지우고 실패는 무시 (이미 없는 파일 포함)
void remove_files_quietly(const std::vector<std::string> & paths);

}  // namespace dictation_cpp
