#include "dictation_cpp/wav_writer.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

using namespace std;


namespace dictation_cpp
{

namespace
{
void write_u16_le(ofstream & out, uint16_t v)
{
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
}

void write_u32_le(ofstream & out, uint32_t v)
{
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
  out.put(static_cast<char>((v >> 16) & 0xFF));
  out.put(static_cast<char>((v >> 24) & 0xFF));
}

atomic<uint64_t> temp_counter{0};
}  // namespace

WavWriter::WavWriter() = default;

string WavWriter::make_temp_prefix(const string & tag) const
{
  error_code ec;
  filesystem::path dir = filesystem::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }
  const auto stamp = chrono::duration_cast<chrono::milliseconds>(
    chrono::system_clock::now().time_since_epoch()).count();

  ostringstream name;
  name << tag << "-" << getpid() << "-" << stamp << "-" << temp_counter.fetch_add(1);
  return (dir / name.str()).string();
}

bool WavWriter::write_float_mono(
  const string & file_path,
  const vector<float> & samples,
  uint32_t sample_rate) const
{
  /// float 샘플을 [-1, 1]로 클리핑 후 PCM16 mono RIFF/WAVE로 직렬화
  ofstream out(file_path, ios::binary);
  if (!out.is_open()) {
    return false;
  }

  constexpr uint16_t kChannels = 1;
  constexpr uint16_t kBitsPerSample = 16;
  const uint32_t byte_rate = sample_rate * kChannels * (kBitsPerSample / 8);
  const uint16_t block_align = static_cast<uint16_t>(kChannels * (kBitsPerSample / 8));
  const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
  const uint32_t riff_size = 36 + data_size;

  out.write("RIFF", 4);
  write_u32_le(out, riff_size);
  out.write("WAVE", 4);

  out.write("fmt ", 4);
  write_u32_le(out, 16);
  write_u16_le(out, 1);
  write_u16_le(out, kChannels);
  write_u32_le(out, sample_rate);
  write_u32_le(out, byte_rate);
  write_u16_le(out, block_align);
  write_u16_le(out, kBitsPerSample);

  out.write("data", 4);
  write_u32_le(out, data_size);
  for (const float s : samples) {
    const float clamped = (s < -1.0F) ? -1.0F : (s > 1.0F ? 1.0F : s);
    const int16_t pcm = static_cast<int16_t>(clamped * 32767.0F);
    write_u16_le(out, static_cast<uint16_t>(pcm));
  }

  return out.good();
}

void remove_files_quietly(const vector<string> & paths)
{
  for (const auto & path : paths) {
    error_code ec;
    filesystem::remove(path, ec);
  }
}

}  // namespace dictation_cpp
