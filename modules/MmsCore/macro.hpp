/// @file macro.hpp
/// @brief MMSeg 内部并行宏定义 (OpenMP 可选)

#pragma once

#ifdef MMS_USE_OPENMP
  #include <omp.h>
  #define MMS_OMP_PARALLEL_FOR _Pragma("omp parallel for schedule(static)")
  // 每个三角形的递归代价差异很大，用动态调度
  #define MMS_OMP_PARALLEL_FOR_DYNAMIC _Pragma("omp parallel for schedule(dynamic, 64)")
  #define MMS_OMP_SET_NUM_THREADS(n) omp_set_num_threads(n)
#else
  #define MMS_OMP_PARALLEL_FOR
  #define MMS_OMP_PARALLEL_FOR_DYNAMIC
  #define MMS_OMP_SET_NUM_THREADS(n) ((void)0)
#endif
