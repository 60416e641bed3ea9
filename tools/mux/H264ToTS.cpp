// Repository: h264ts
// Component: h264ts_mux
// Purpose: Command-line tool that muxes an H.264 video stream into an MPEG-TS file.
// Copyright (c) 2025 RetroVue

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "h264ts/bitstream/BitstreamCodec.h"
#include "h264ts/encoder/AccessUnitEncoder.h"
#include "h264ts/input/AccessUnitReader.h"
#include "h264ts/mux/FFmpegTSMuxer.hpp"
#include "h264ts/output/FileSink.h"

namespace
{
  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 1;
  constexpr int kExitFailure = 2;

  struct ParsedArgs
  {
    std::string input;
    std::string output;
    double fps = 0.0;
    int pid = 256;
    int offset_ms = 400;
    bool help = false;
  };

  // Closes the encoder after a failure; the output file may be truncated.
  void Abort(h264ts::encoder::AccessUnitEncoder &encoder)
  {
    const h264ts::encoder::EncoderStatus status = encoder.Close();
    if (status != h264ts::encoder::EncoderStatus::kOk)
    {
      std::cerr << "[h264ts_mux] Close after failure: " << h264ts::encoder::ToString(status)
                << std::endl;
    }
  }

  void PrintUsage(const char *program)
  {
    std::cerr << "Usage: " << program
              << " --input <file> --output <file.ts> [--fps <rate>] [--pid <n>]"
                 " [--offset-ms <n>]"
              << std::endl;
  }

  // Throws std::invalid_argument on malformed or missing values.
  ParsedArgs ParseArgs(int argc, char **argv)
  {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--help" || arg == "-h")
      {
        args.help = true;
      }
      else if (arg == "--input" && i + 1 < argc)
      {
        args.input = argv[++i];
      }
      else if (arg == "--output" && i + 1 < argc)
      {
        args.output = argv[++i];
      }
      else if (arg == "--fps" && i + 1 < argc)
      {
        args.fps = std::stod(argv[++i]);
      }
      else if (arg == "--pid" && i + 1 < argc)
      {
        args.pid = std::stoi(argv[++i]);
      }
      else if (arg == "--offset-ms" && i + 1 < argc)
      {
        args.offset_ms = std::stoi(argv[++i]);
      }
      else
      {
        throw std::invalid_argument("unknown or incomplete option " + std::string(arg));
      }
    }

    if (args.help)
    {
      return args;
    }
    if (args.input.empty() || args.output.empty())
    {
      throw std::invalid_argument("--input and --output are required");
    }
    if (args.fps < 0.0)
    {
      throw std::invalid_argument("--fps must not be negative");
    }
    if (args.pid < 0x10 || args.pid > 0x1FFE)
    {
      throw std::invalid_argument("--pid must be within 16..8190");
    }
    if (args.offset_ms < 0)
    {
      throw std::invalid_argument("--offset-ms must not be negative");
    }
    return args;
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace h264ts;

  ParsedArgs args;
  try
  {
    args = ParseArgs(argc, argv);
  }
  catch (const std::exception &e)
  {
    std::cerr << "[h264ts_mux] Invalid arguments: " << e.what() << std::endl;
    PrintUsage(argv[0]);
    return kExitUsage;
  }
  if (args.help)
  {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  input::ReaderConfig reader_config;
  reader_config.input_uri = args.input;
  reader_config.frame_rate = args.fps;

  input::AccessUnitReader reader(reader_config);
  if (!reader.Open())
  {
    return kExitFailure;
  }

  output::FileSinkConfig sink_config;
  sink_config.path = args.output;

  encoder::EncoderConfig encoder_config;
  encoder_config.video_pid = static_cast<uint16_t>(args.pid);
  encoder_config.pts_offset_us = static_cast<int64_t>(args.offset_ms) * 1000;

  encoder::AccessUnitEncoder encoder(
      encoder_config,
      std::make_unique<bitstream::H264BitstreamCodec>(),
      std::make_unique<mux::FFmpegTSMuxer>(),
      std::make_unique<output::FileSink>(sink_config));

  encoder::EncoderStatus status = encoder.Open(reader.sps(), reader.pps());
  if (status != encoder::EncoderStatus::kOk)
  {
    std::cerr << "[h264ts_mux] Failed to open encoder: " << encoder::ToString(status)
              << std::endl;
    return kExitFailure;
  }

  bitstream::AccessUnit access_unit;
  while (reader.ReadNext(access_unit))
  {
    status = encoder.Encode(access_unit);
    if (status != encoder::EncoderStatus::kOk)
    {
      std::cerr << "[h264ts_mux] Encode failed at access unit " << reader.AccessUnitsRead()
                << ": " << encoder::ToString(status) << std::endl;
      Abort(encoder);
      return kExitFailure;
    }
  }

  if (reader.HasError())
  {
    Abort(encoder);
    return kExitFailure;
  }

  status = encoder.Close();
  if (status != encoder::EncoderStatus::kOk)
  {
    std::cerr << "[h264ts_mux] Failed to finish output: " << encoder::ToString(status)
              << std::endl;
    return kExitFailure;
  }

  const encoder::EncoderStats stats = encoder.GetStats();
  std::cout << "[h264ts_mux] Done | read=" << reader.AccessUnitsRead()
            << " written=" << stats.packets_written
            << " dropped=" << (stats.dropped_not_ready + stats.dropped_before_idr)
            << " bytes=" << stats.payload_bytes << " output=" << args.output << std::endl;
  return kExitOk;
}
